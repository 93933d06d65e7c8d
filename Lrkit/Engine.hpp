#ifndef LRKIT_ENGINE_HPP
#define LRKIT_ENGINE_HPP

#include "Lrkit/Grammar.hpp"
#include "Lrkit/ParseTable.hpp"

#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Lrkit {

    struct ParseNode {
        static constexpr unsigned int kNoProduction = Grammar::kInvalidIndex;

        bool isTerminal() const;
        // Terminal leaves, left to right.
        std::vector<std::string> leaves() const;

        std::string symbol;
        unsigned int production;
        std::string productionText;
        std::vector<ParseNode> children;
    };

    struct Step {
        unsigned int index;
        ParseTable::Action action;
        unsigned int state;
        std::string token;
        // states.size() == symbols.size() + 1; the stack reads states[0] symbols[0] states[1] ...
        std::vector<unsigned int> states;
        std::vector<std::string> symbols;
        std::vector<std::string> input;
        std::string message;
        // Reduce steps only.
        std::string production;
    };

    struct ParseResult {
        ParseNode tree;
        std::vector<Step> steps;
    };

    // No ACTION entry for the current state and token.
    class ParseRejectedError : public std::runtime_error {
    public:
        ParseRejectedError(unsigned int state, const std::string &token, size_t position, std::vector<Step> &&steps);

        unsigned int state() const;
        const std::string &token() const;
        size_t position() const;
        const std::vector<Step> &steps() const;

    private:
        unsigned int mState;
        std::string mToken;
        size_t mPosition;
        std::vector<Step> mSteps;
    };

    // Shift-reduce stack machine over a ParseTable. Each call to parse() is independent.
    class Engine
    {
    public:
        Engine(const ParseTable &table);

        void setTrace(std::ostream *stream);
        void setMaxSteps(size_t steps);

        // Accepts or throws ParseRejectedError. The end marker is appended by the engine.
        ParseResult parse(const std::vector<std::string> &tokens) const;

    private:
        void trace(const Step &step) const;

        const ParseTable &mTable;
        const Grammar &mGrammar;
        std::ostream *mTrace;
        size_t mMaxSteps;
    };
}

#endif
