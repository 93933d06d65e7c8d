#ifndef LRKIT_PARSETABLE_HPP
#define LRKIT_PARSETABLE_HPP

#include "Lrkit/Automaton.hpp"
#include "Lrkit/FirstFollow.hpp"

#include "Util/Table.hpp"

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Lrkit {

    class ParseTable
    {
    public:
        struct Action {
            enum class Type {
                Error,
                Shift,
                Reduce,
                Accept
            };

            bool operator==(const Action &other) const;
            bool operator!=(const Action &other) const;

            // "s3", "r2", "acc"; empty for Error.
            std::string toString() const;
            // Inverse of toString(); an unreadable string yields an Error action.
            static Action parse(const std::string &text);

            Type type;
            unsigned int index;
        };

        struct Conflict {
            enum class Type {
                ShiftReduce,
                ReduceReduce
            };
            Type type;
            unsigned int state;
            unsigned int terminal;
            Action kept;
            Action discarded;
        };

        // Terminals on which a complete item of the given production may reduce.
        typedef std::function<std::set<unsigned int>(unsigned int production)> ReduceLookahead;

        static ReduceLookahead allTerminals(const Grammar &grammar);
        static ReduceLookahead followSet(const Grammar &grammar, const FirstFollow &sets);

        ParseTable(const Automaton &automaton, ReduceLookahead reduceLookahead);

        const Grammar &grammar() const;
        unsigned int stateCount() const;

        const Action &action(unsigned int state, unsigned int terminal) const;
        std::optional<unsigned int> gotoState(unsigned int state, unsigned int nonterminal) const;

        const std::vector<Conflict> &conflicts() const;
        std::vector<Conflict> conflicts(Conflict::Type type) const;
        bool conflictFree() const;

    private:
        void computeParseTable(const Automaton &automaton, ReduceLookahead reduceLookahead);
        void setAction(unsigned int state, unsigned int terminal, const Action &action);

        const Grammar &mGrammar;
        Util::Table<Action> mActions;
        Util::Table<unsigned int> mGotos;
        std::vector<Conflict> mConflicts;
    };
}

#endif
