#ifndef SERVICE_HPP
#define SERVICE_HPP

#include "Lrkit/Generator.hpp"
#include "Lrkit/Engine.hpp"

#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

struct ConflictReport {
    unsigned int state;
    std::string symbol;
    std::string kept;
    std::string discarded;
};

struct GenerateReport {
    struct State {
        unsigned int id;
        std::vector<std::string> items;
    };

    struct Transition {
        unsigned int from;
        unsigned int to;
        std::string symbol;
    };

    // Non-terminals in definition order, then terminals in appearance order.
    typedef std::vector<std::pair<std::string, std::vector<std::string>>> SymbolSets;

    Lrkit::ParserType parserType;
    std::vector<std::string> augmentedGrammar;
    std::vector<State> states;
    std::map<unsigned int, std::map<std::string, std::string>> actionTable;
    std::map<unsigned int, std::map<std::string, unsigned int>> gotoTable;
    std::vector<Transition> transitions;
    std::vector<std::string> terminals;
    std::vector<std::string> nonterminals;
    std::vector<ConflictReport> shiftReduceConflicts;
    std::vector<ConflictReport> reduceReduceConflicts;
    // is_lr0 or is_slr1, depending on parserType.
    bool valid;
    std::optional<SymbolSets> firstSets;
    std::optional<SymbolSets> followSets;
    unsigned int numStates;
};

struct ParseReport {
    bool accepted;
    std::string error;
    std::optional<Lrkit::ParseNode> tree;
    std::vector<Lrkit::Step> steps;
};

// Raised by Service::parse when the generated table has conflicts.
class GrammarConflictError : public std::runtime_error {
public:
    GrammarConflictError(const std::string &message, std::vector<ConflictReport> &&shiftReduce, std::vector<ConflictReport> &&reduceReduce);

    const std::vector<ConflictReport> &shiftReduceConflicts() const;
    const std::vector<ConflictReport> &reduceReduceConflicts() const;

private:
    std::vector<ConflictReport> mShiftReduce;
    std::vector<ConflictReport> mReduceReduce;
};

// The generate and parse requests, from grammar text to display-ready reports.
class Service
{
public:
    Service(Lrkit::ParserType type);

    void setTrace(std::ostream *stream);
    void setMaxSteps(size_t steps);

    // Throws InvalidGrammarError.
    GenerateReport generate(const std::string &grammarText) const;

    // Throws InvalidGrammarError or GrammarConflictError. A rejected input is an
    // ordinary result with accepted == false.
    ParseReport parse(const std::string &grammarText, const std::string &input) const;

    static GenerateReport report(const Lrkit::Generator &generator);

private:
    std::unique_ptr<Lrkit::Generator> build(const std::string &grammarText) const;

    Lrkit::ParserType mType;
    std::ostream *mTrace;
    size_t mMaxSteps;
};

#endif
