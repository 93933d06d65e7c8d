#include <catch2/catch.hpp>

#include "GrammarReader.hpp"

#include <sstream>

using Lrkit::Grammar;

TEST_CASE("grammar text is read into productions", "[reader]")
{
    GrammarReader reader(
        "# expression grammar\n"
        "S -> E\n"
        "\n"
        "E -> T + E | T\n"
        "T -> F * T | F\n"
        "F -> ( E ) | id\n");

    REQUIRE(reader.valid());
    const Grammar &grammar = reader.grammar();
    REQUIRE(grammar.productions().size() == 7);
    REQUIRE(grammar.nonterminals() == std::vector<std::string>{"S", "E", "T", "F"});
    REQUIRE(grammar.terminals() == std::vector<std::string>{"+", "*", "(", ")", "id", "$"});
    REQUIRE(grammar.productionString(1) == "E → T + E");
    REQUIRE(grammar.productionString(2) == "E → T");
    REQUIRE(grammar.nonterminals()[grammar.startSymbol()] == "S");
}

TEST_CASE("the unicode arrow and epsilon spellings are accepted", "[reader]")
{
    GrammarReader reader("S → A B\nA → a | ε\nB → b | epsilon\n");

    REQUIRE(reader.valid());
    REQUIRE(reader.rules().size() == 5);
    REQUIRE(reader.rules()[2].lhs == "A");
    REQUIRE(reader.rules()[2].rhs.empty());
    REQUIRE(reader.rules()[4].rhs.empty());
    REQUIRE(reader.grammar().productionString(4) == "B → ε");
}

TEST_CASE("the first left-hand side is the start symbol", "[reader]")
{
    GrammarReader reader("A -> B x\nB -> y\n");

    REQUIRE(reader.valid());
    REQUIRE(reader.grammar().nonterminals()[reader.grammar().startSymbol()] == "A");
}

TEST_CASE("quotes protect the alternative separator", "[reader]")
{
    GrammarReader reader("S -> S '|' a | a\n");

    REQUIRE(reader.valid());
    REQUIRE(reader.rules().size() == 2);
    REQUIRE(reader.rules()[0].rhs == std::vector<std::string>{"S", "'|'", "a"});
    REQUIRE(reader.rules()[1].rhs == std::vector<std::string>{"a"});
}

TEST_CASE("a trailing prime is part of a symbol name", "[reader]")
{
    GrammarReader reader("E -> T E'\nE' -> + T E' | ε\nT -> id\n");

    REQUIRE(reader.valid());
    REQUIRE(reader.rules()[0].rhs == std::vector<std::string>{"T", "E'"});
    REQUIRE(reader.grammar().nonterminalIndex("E'") != Grammar::kInvalidIndex);
}

TEST_CASE("the reader accepts a stream", "[reader]")
{
    std::istringstream stream("S -> a S | b\n");
    GrammarReader reader(stream);

    REQUIRE(reader.valid());
    REQUIRE(reader.rules().size() == 2);
}

TEST_CASE("malformed grammar text is reported with its line", "[reader]")
{
    SECTION("empty alternative")
    {
        GrammarReader reader("A->");
        REQUIRE_FALSE(reader.valid());
        REQUIRE(reader.parseError().line == 1);
        REQUIRE(reader.parseError().message == "empty alternative for 'A' (write ε for an empty production)");
    }

    SECTION("empty alternative between separators")
    {
        GrammarReader reader("S -> a\nS -> b | | c\n");
        REQUIRE_FALSE(reader.valid());
        REQUIRE(reader.parseError().line == 2);
    }

    SECTION("missing arrow")
    {
        GrammarReader reader("S -> a\n\nS a b\n");
        REQUIRE_FALSE(reader.valid());
        REQUIRE(reader.parseError().line == 3);
    }

    SECTION("missing left-hand side")
    {
        GrammarReader reader("-> a\n");
        REQUIRE_FALSE(reader.valid());
        REQUIRE(reader.parseError().message == "missing left-hand side");
    }

    SECTION("left-hand side with two symbols")
    {
        GrammarReader reader("S T -> a\n");
        REQUIRE_FALSE(reader.valid());
        REQUIRE(reader.parseError().line == 1);
    }

    SECTION("unterminated quote")
    {
        GrammarReader reader("S -> 'a\n");
        REQUIRE_FALSE(reader.valid());
        REQUIRE(reader.parseError().message == "unterminated quote");
    }

    SECTION("only comments")
    {
        GrammarReader reader("# nothing here\n\n");
        REQUIRE_FALSE(reader.valid());
        REQUIRE(reader.parseError().message == "grammar has no productions");
    }

    SECTION("reserved symbol")
    {
        GrammarReader reader("S -> a $\n");
        REQUIRE_FALSE(reader.valid());
        REQUIRE(reader.parseError().line == 0);
        REQUIRE_FALSE(reader.parseError().message.empty());
    }
}
