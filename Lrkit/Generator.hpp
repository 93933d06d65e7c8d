#ifndef LRKIT_GENERATOR_HPP
#define LRKIT_GENERATOR_HPP

#include "Lrkit/Grammar.hpp"
#include "Lrkit/Automaton.hpp"
#include "Lrkit/FirstFollow.hpp"
#include "Lrkit/ParseTable.hpp"

#include <memory>
#include <ostream>
#include <string>

namespace Lrkit {

    enum class ParserType {
        LR0,
        SLR1
    };

    // "LR(0)" or "SLR(1)", for messages.
    const char *parserTypeName(ParserType type);
    // Reads the option spelling, "lr0" or "slr1".
    bool parserTypeFromName(const std::string &name, ParserType &type);

    // Builds the automaton and the parse table for one grammar. The only difference
    // between LR(0) and SLR(1) is the lookahead handed to the table.
    class Generator
    {
    public:
        Generator(const Grammar &grammar, ParserType type);
        Generator(const Generator &) = delete;
        Generator &operator=(const Generator &) = delete;

        ParserType type() const;

        // The augmented grammar.
        const Grammar &grammar() const;
        const Automaton &automaton() const;
        const ParseTable &table() const;
        // Null for LR(0).
        const FirstFollow *firstFollow() const;

        // is_lr0 / is_slr1
        bool valid() const;

        void print(std::ostream &stream) const;

    private:
        ParserType mType;
        Grammar mGrammar;
        std::unique_ptr<Automaton> mAutomaton;
        std::unique_ptr<FirstFollow> mFirstFollow;
        std::unique_ptr<ParseTable> mTable;
    };
}

#endif
