#include "Service.hpp"
#include "GrammarReader.hpp"
#include "InputTokenizer.hpp"

#include "Lrkit/Errors.hpp"

GrammarConflictError::GrammarConflictError(const std::string &message, std::vector<ConflictReport> &&shiftReduce, std::vector<ConflictReport> &&reduceReduce)
: std::runtime_error(message), mShiftReduce(std::move(shiftReduce)), mReduceReduce(std::move(reduceReduce))
{
}

const std::vector<ConflictReport> &GrammarConflictError::shiftReduceConflicts() const
{
    return mShiftReduce;
}

const std::vector<ConflictReport> &GrammarConflictError::reduceReduceConflicts() const
{
    return mReduceReduce;
}

static GenerateReport::SymbolSets formatSets(const Lrkit::Grammar &grammar, const std::vector<std::pair<std::string, const Lrkit::FirstFollow::TerminalSet*>> &sets)
{
    GenerateReport::SymbolSets result;
    for(const auto &entry : sets) {
        result.emplace_back(entry.first, std::vector<std::string>());
        std::vector<std::string> &names = result.back().second;
        for(unsigned int terminal : *entry.second) {
            if(terminal == Lrkit::FirstFollow::kEpsilon) {
                names.push_back(Lrkit::Grammar::kEpsilon);
            } else {
                names.push_back(grammar.terminals()[terminal]);
            }
        }
    }
    return result;
}

static std::vector<ConflictReport> formatConflicts(const Lrkit::Grammar &grammar, const std::vector<Lrkit::ParseTable::Conflict> &conflicts)
{
    std::vector<ConflictReport> result;
    for(const auto &conflict : conflicts) {
        result.push_back(ConflictReport{conflict.state, grammar.terminals()[conflict.terminal], conflict.kept.toString(), conflict.discarded.toString()});
    }
    return result;
}

Service::Service(Lrkit::ParserType type)
: mType(type)
{
    mTrace = nullptr;
    mMaxSteps = 100000;
}

void Service::setTrace(std::ostream *stream)
{
    mTrace = stream;
}

void Service::setMaxSteps(size_t steps)
{
    mMaxSteps = steps;
}

std::unique_ptr<Lrkit::Generator> Service::build(const std::string &grammarText) const
{
    GrammarReader reader(grammarText);
    if(!reader.valid()) {
        const GrammarReader::ParseError &error = reader.parseError();
        if(error.line > 0) {
            throw Lrkit::InvalidGrammarError("line " + std::to_string(error.line) + ": " + error.message);
        }
        throw Lrkit::InvalidGrammarError(error.message);
    }

    return std::make_unique<Lrkit::Generator>(reader.grammar(), mType);
}

GenerateReport Service::generate(const std::string &grammarText) const
{
    std::unique_ptr<Lrkit::Generator> generator = build(grammarText);
    if(mTrace) {
        generator->print(*mTrace);
    }
    return report(*generator);
}

GenerateReport Service::report(const Lrkit::Generator &generator)
{
    const Lrkit::Grammar &grammar = generator.grammar();
    const Lrkit::Automaton &automaton = generator.automaton();
    const Lrkit::ParseTable &table = generator.table();

    GenerateReport result;
    result.parserType = generator.type();

    for(unsigned int i=0; i<grammar.productions().size(); i++) {
        result.augmentedGrammar.push_back(grammar.productionString(i));
    }

    for(const auto &state : automaton.states()) {
        GenerateReport::State entry{state.id, {}};
        for(const auto &item : state.items) {
            entry.items.push_back(automaton.items().itemString(item));
        }
        result.states.push_back(std::move(entry));
    }

    for(unsigned int i=0; i<table.stateCount(); i++) {
        for(unsigned int t=0; t<grammar.terminals().size(); t++) {
            const Lrkit::ParseTable::Action &action = table.action(i, t);
            if(action.type != Lrkit::ParseTable::Action::Type::Error) {
                result.actionTable[i][grammar.terminals()[t]] = action.toString();
            }
        }
        for(unsigned int n=0; n<grammar.nonterminals().size(); n++) {
            std::optional<unsigned int> target = table.gotoState(i, n);
            if(target) {
                result.gotoTable[i][grammar.nonterminals()[n]] = *target;
            }
        }
    }

    for(const auto &transition : automaton.transitions()) {
        result.transitions.push_back(GenerateReport::Transition{transition.from, transition.to, grammar.name(transition.symbol)});
    }

    result.terminals = grammar.terminals();
    result.nonterminals = grammar.nonterminals();

    result.shiftReduceConflicts = formatConflicts(grammar, table.conflicts(Lrkit::ParseTable::Conflict::Type::ShiftReduce));
    result.reduceReduceConflicts = formatConflicts(grammar, table.conflicts(Lrkit::ParseTable::Conflict::Type::ReduceReduce));
    result.valid = generator.valid();

    const Lrkit::FirstFollow *sets = generator.firstFollow();
    if(sets) {
        std::vector<std::pair<std::string, const Lrkit::FirstFollow::TerminalSet*>> firsts;
        std::vector<std::pair<std::string, const Lrkit::FirstFollow::TerminalSet*>> follows;
        for(unsigned int n=0; n<grammar.nonterminals().size(); n++) {
            firsts.emplace_back(grammar.nonterminals()[n], &sets->first(Lrkit::Grammar::Symbol{Lrkit::Grammar::Symbol::Type::Nonterminal, n}));
            follows.emplace_back(grammar.nonterminals()[n], &sets->follow(n));
        }
        for(unsigned int t=0; t<grammar.terminals().size(); t++) {
            if(t != grammar.endMarker()) {
                firsts.emplace_back(grammar.terminals()[t], &sets->first(Lrkit::Grammar::Symbol{Lrkit::Grammar::Symbol::Type::Terminal, t}));
            }
        }
        result.firstSets = formatSets(grammar, firsts);
        result.followSets = formatSets(grammar, follows);
    }

    result.numStates = (unsigned int)automaton.states().size();
    return result;
}

ParseReport Service::parse(const std::string &grammarText, const std::string &input) const
{
    std::unique_ptr<Lrkit::Generator> generator = build(grammarText);

    if(!generator->valid()) {
        const Lrkit::Grammar &grammar = generator->grammar();
        const Lrkit::ParseTable &table = generator->table();
        throw GrammarConflictError(std::string("Grammar is not ") + Lrkit::parserTypeName(mType) + ". Cannot parse with conflicts.",
                                   formatConflicts(grammar, table.conflicts(Lrkit::ParseTable::Conflict::Type::ShiftReduce)),
                                   formatConflicts(grammar, table.conflicts(Lrkit::ParseTable::Conflict::Type::ReduceReduce)));
    }

    ParseReport result;
    result.accepted = false;

    std::vector<std::string> tokens;
    try {
        InputTokenizer tokenizer(generator->grammar().terminals());
        tokens = InputTokenizer::texts(tokenizer.tokenize(input));
    } catch(const InputTokenizer::UnknownTokenError &e) {
        result.error = e.what();
        return result;
    }

    Lrkit::Engine engine(generator->table());
    engine.setTrace(mTrace);
    engine.setMaxSteps(mMaxSteps);

    try {
        Lrkit::ParseResult parsed = engine.parse(tokens);
        result.accepted = true;
        result.tree = std::move(parsed.tree);
        result.steps = std::move(parsed.steps);
    } catch(const Lrkit::ParseRejectedError &e) {
        result.error = e.what();
        result.steps = e.steps();
    }

    return result;
}
