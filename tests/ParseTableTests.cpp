#include <catch2/catch.hpp>

#include "Lrkit/Generator.hpp"
#include "TestGrammars.hpp"

#include <stdexcept>

using Lrkit::Generator;
using Lrkit::Grammar;
using Lrkit::ParserType;
using Lrkit::ParseTable;

namespace {
    std::string cell(const Generator &generator, unsigned int state, const std::string &terminal)
    {
        return generator.table().action(state, generator.grammar().terminalIndex(terminal)).toString();
    }

    std::optional<unsigned int> gotoCell(const Generator &generator, unsigned int state, const std::string &nonterminal)
    {
        return generator.table().gotoState(state, generator.grammar().nonterminalIndex(nonterminal));
    }
}

TEST_CASE("actions render and parse in table notation", "[table]")
{
    ParseTable::Action shift{ParseTable::Action::Type::Shift, 3};
    ParseTable::Action reduce{ParseTable::Action::Type::Reduce, 2};
    ParseTable::Action accept{ParseTable::Action::Type::Accept, 0};

    REQUIRE(shift.toString() == "s3");
    REQUIRE(reduce.toString() == "r2");
    REQUIRE(accept.toString() == "acc");
    REQUIRE(ParseTable::Action{ParseTable::Action::Type::Error, 0}.toString().empty());

    REQUIRE(ParseTable::Action::parse("s3") == shift);
    REQUIRE(ParseTable::Action::parse("r2") == reduce);
    REQUIRE(ParseTable::Action::parse("acc") == accept);
    REQUIRE(ParseTable::Action::parse("accept") == accept);
    REQUIRE(ParseTable::Action::parse("s12").index == 12);

    REQUIRE(ParseTable::Action::parse("x").type == ParseTable::Action::Type::Error);
    REQUIRE(ParseTable::Action::parse("s").type == ParseTable::Action::Type::Error);
    REQUIRE(ParseTable::Action::parse("r2a").type == ParseTable::Action::Type::Error);
    REQUIRE(shift != ParseTable::Action{ParseTable::Action::Type::Shift, 4});
}

TEST_CASE("LR(0) table of a right-recursive grammar", "[table]")
{
    Generator generator(TestGrammars::make(TestGrammars::rightRecursive()), ParserType::LR0);
    const ParseTable &table = generator.table();

    REQUIRE(generator.valid());
    REQUIRE(table.conflictFree());
    REQUIRE(table.stateCount() == 6);

    REQUIRE(cell(generator, 0, "a") == "s1");
    REQUIRE(cell(generator, 0, "b") == "s2");
    REQUIRE(cell(generator, 0, "$").empty());
    REQUIRE(gotoCell(generator, 0, "S") == 3u);
    REQUIRE(gotoCell(generator, 0, "A") == 4u);

    REQUIRE(cell(generator, 1, "a") == "s1");
    REQUIRE(cell(generator, 1, "b") == "s2");
    REQUIRE(gotoCell(generator, 1, "A") == 5u);
    REQUIRE_FALSE(gotoCell(generator, 1, "S").has_value());

    // LR(0) reduces on every terminal, the end marker included.
    for(const char *terminal : {"a", "b", "$"}) {
        REQUIRE(cell(generator, 2, terminal) == "r3");
        REQUIRE(cell(generator, 4, terminal) == "r1");
        REQUIRE(cell(generator, 5, terminal) == "r2");
    }

    REQUIRE(cell(generator, 3, "$") == "acc");
    REQUIRE(cell(generator, 3, "a").empty());
}

TEST_CASE("SLR(1) restricts reductions to FOLLOW sets", "[table]")
{
    Generator generator(TestGrammars::make(TestGrammars::rightRecursive()), ParserType::SLR1);

    REQUIRE(generator.valid());
    REQUIRE(cell(generator, 2, "$") == "r3");
    REQUIRE(cell(generator, 2, "a").empty());
    REQUIRE(cell(generator, 2, "b").empty());
    REQUIRE(cell(generator, 4, "$") == "r1");
    REQUIRE(cell(generator, 5, "$") == "r2");
}

TEST_CASE("the expression grammar is SLR(1) but not LR(0)", "[table]")
{
    Grammar grammar = TestGrammars::make(TestGrammars::expression());

    Generator lr0(grammar, ParserType::LR0);
    REQUIRE_FALSE(lr0.valid());
    REQUIRE(lr0.table().conflicts(ParseTable::Conflict::Type::ShiftReduce).size() == 2);
    REQUIRE(lr0.table().conflicts(ParseTable::Conflict::Type::ReduceReduce).empty());

    Generator slr1(grammar, ParserType::SLR1);
    REQUIRE(slr1.valid());
    REQUIRE(slr1.table().stateCount() == 13);
    REQUIRE(slr1.table().conflictFree());
}

TEST_CASE("shift wins a shift/reduce conflict", "[table]")
{
    Generator generator(TestGrammars::make(TestGrammars::ambiguous()), ParserType::LR0);
    std::vector<ParseTable::Conflict> conflicts = generator.table().conflicts(ParseTable::Conflict::Type::ShiftReduce);

    REQUIRE_FALSE(conflicts.empty());
    for(const auto &conflict : conflicts) {
        REQUIRE(conflict.kept.type == ParseTable::Action::Type::Shift);
        REQUIRE(conflict.discarded.type == ParseTable::Action::Type::Reduce);
        REQUIRE(generator.table().action(conflict.state, conflict.terminal) == conflict.kept);
    }

    // The ambiguity survives FOLLOW filtering.
    Generator slr1(TestGrammars::make(TestGrammars::ambiguous()), ParserType::SLR1);
    REQUIRE_FALSE(slr1.valid());
}

TEST_CASE("the lower-numbered production wins a reduce/reduce conflict", "[table]")
{
    Grammar grammar = TestGrammars::make(TestGrammars::reduceReduce());

    Generator slr1(grammar, ParserType::SLR1);
    const std::vector<ParseTable::Conflict> &conflicts = slr1.table().conflicts();
    REQUIRE(conflicts.size() == 1);
    REQUIRE(conflicts[0].type == ParseTable::Conflict::Type::ReduceReduce);
    REQUIRE(conflicts[0].state == 1);
    REQUIRE(slr1.grammar().terminals()[conflicts[0].terminal] == "$");
    REQUIRE(conflicts[0].kept.toString() == "r3");
    REQUIRE(conflicts[0].discarded.toString() == "r4");
    REQUIRE(cell(slr1, 1, "$") == "r3");

    Generator lr0(grammar, ParserType::LR0);
    REQUIRE(lr0.table().conflicts(ParseTable::Conflict::Type::ReduceReduce).size() == 2);
    REQUIRE(lr0.table().conflicts(ParseTable::Conflict::Type::ShiftReduce).empty());
}

TEST_CASE("accept colliding with a reduction is a reduce/reduce conflict", "[table]")
{
    // S -> A ; A -> S | x
    Grammar grammar({{"S", {"A"}}, {"A", {"S"}}, {"A", {"x"}}}, "S");
    Generator generator(grammar, ParserType::SLR1);

    std::vector<ParseTable::Conflict> conflicts = generator.table().conflicts(ParseTable::Conflict::Type::ReduceReduce);
    REQUIRE(conflicts.size() == 1);
    REQUIRE(generator.grammar().terminals()[conflicts[0].terminal] == "$");
    REQUIRE(conflicts[0].kept.type == ParseTable::Action::Type::Accept);
    REQUIRE(conflicts[0].discarded.toString() == "r2");
}

TEST_CASE("empty productions reduce without consuming input", "[table]")
{
    Grammar grammar = TestGrammars::make(TestGrammars::nullable());

    Generator slr1(grammar, ParserType::SLR1);
    REQUIRE(slr1.valid());
    REQUIRE(cell(slr1, 0, "a") == "s1");
    REQUIRE(cell(slr1, 0, "b") == "r3");
    REQUIRE(cell(slr1, 0, "$") == "r3");
    REQUIRE(cell(slr1, 3, "b") == "s4");
    REQUIRE(cell(slr1, 3, "$") == "r5");

    Generator lr0(grammar, ParserType::LR0);
    REQUIRE_FALSE(lr0.valid());
    bool startConflict = false;
    for(const auto &conflict : lr0.table().conflicts()) {
        if(conflict.state == 0 && lr0.grammar().terminals()[conflict.terminal] == "a") {
            startConflict = true;
            REQUIRE(conflict.type == ParseTable::Conflict::Type::ShiftReduce);
            REQUIRE(conflict.kept.toString() == "s1");
            REQUIRE(conflict.discarded.toString() == "r3");
        }
    }
    REQUIRE(startConflict);
}

TEST_CASE("every GOTO entry follows a non-terminal transition", "[table]")
{
    Generator generator(TestGrammars::make(TestGrammars::leftRecursiveExpression()), ParserType::SLR1);
    const Grammar &grammar = generator.grammar();

    REQUIRE(generator.valid());
    for(unsigned int state=0; state<generator.table().stateCount(); state++) {
        for(unsigned int n=0; n<grammar.nonterminals().size(); n++) {
            Grammar::Symbol symbol{Grammar::Symbol::Type::Nonterminal, n};
            REQUIRE(generator.table().gotoState(state, n) == generator.automaton().transition(state, symbol));
        }
    }
}

TEST_CASE("parser types map to option and display names", "[table]")
{
    ParserType type = ParserType::LR0;
    REQUIRE(Lrkit::parserTypeFromName("slr1", type));
    REQUIRE(type == ParserType::SLR1);
    REQUIRE(Lrkit::parserTypeFromName("lr0", type));
    REQUIRE(type == ParserType::LR0);

    REQUIRE_FALSE(Lrkit::parserTypeFromName("lalr1", type));
    REQUIRE_FALSE(Lrkit::parserTypeFromName("--slr1", type));
    REQUIRE(type == ParserType::LR0);

    REQUIRE(std::string(Lrkit::parserTypeName(ParserType::LR0)) == "LR(0)");
    REQUIRE(std::string(Lrkit::parserTypeName(ParserType::SLR1)) == "SLR(1)");
}

TEST_CASE("table cells outside the sized grid are rejected", "[table]")
{
    Generator generator(TestGrammars::make(TestGrammars::rightRecursive()), ParserType::LR0);
    const ParseTable &table = generator.table();
    const Grammar &grammar = generator.grammar();

    REQUIRE(table.stateCount() == generator.automaton().states().size());
    REQUIRE_NOTHROW(table.action(table.stateCount() - 1, grammar.endMarker()));
    REQUIRE_THROWS_AS(table.action(table.stateCount(), 0), std::out_of_range);
    REQUIRE_THROWS_AS(table.action(0, (unsigned int)grammar.terminals().size()), std::out_of_range);
    REQUIRE_THROWS_AS(table.gotoState(0, (unsigned int)grammar.nonterminals().size()), std::out_of_range);
}
