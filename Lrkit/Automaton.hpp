#ifndef LRKIT_AUTOMATON_HPP
#define LRKIT_AUTOMATON_HPP

#include "Lrkit/Grammar.hpp"
#include "Lrkit/Item.hpp"

#include <map>
#include <optional>
#include <vector>

namespace Lrkit {

    // LR(0) automaton. States are stored in an arena indexed by id, in discovery order.
    class Automaton
    {
    public:
        struct State {
            unsigned int id;
            ItemSet items;
            // symbolIndex -> target state
            std::map<unsigned int, unsigned int> transitions;
        };

        struct Transition {
            unsigned int from;
            unsigned int to;
            Grammar::Symbol symbol;
        };

        // The grammar must be augmented and must outlive the automaton.
        Automaton(const Grammar &grammar);

        const Grammar &grammar() const;
        const Items &items() const;

        const std::vector<State> &states() const;
        const std::vector<Transition> &transitions() const;
        std::optional<unsigned int> transition(unsigned int state, const Grammar::Symbol &symbol) const;

    private:
        void computeStates();

        const Grammar &mGrammar;
        Items mItems;
        std::vector<State> mStates;
        std::vector<Transition> mTransitions;
    };
}

#endif
