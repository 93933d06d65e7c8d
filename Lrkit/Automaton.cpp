#include "Lrkit/Automaton.hpp"
#include "Lrkit/Errors.hpp"

namespace Lrkit {

    Automaton::Automaton(const Grammar &grammar)
    : mGrammar(grammar), mItems(grammar)
    {
        if(!mGrammar.isAugmented()) {
            throw InvalidGrammarError("automaton requires an augmented grammar");
        }

        computeStates();
    }

    const Grammar &Automaton::grammar() const
    {
        return mGrammar;
    }

    const Items &Automaton::items() const
    {
        return mItems;
    }

    const std::vector<Automaton::State> &Automaton::states() const
    {
        return mStates;
    }

    const std::vector<Automaton::Transition> &Automaton::transitions() const
    {
        return mTransitions;
    }

    std::optional<unsigned int> Automaton::transition(unsigned int state, const Grammar::Symbol &symbol) const
    {
        const State &s = mStates.at(state);
        auto it = s.transitions.find(mGrammar.symbolIndex(symbol));
        if(it == s.transitions.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void Automaton::computeStates()
    {
        std::map<ItemSet, unsigned int> known;

        State start;
        start.id = 0;
        start.items = mItems.computeClosure(ItemSet{Item{0, 0}});
        known[start.items] = 0;
        mStates.push_back(std::move(start));

        std::vector<unsigned int> queue;
        queue.push_back(0);

        const unsigned int symbolCount = mGrammar.symbolCount();
        const unsigned int limit = mItems.universeSize() * symbolCount + 1;

        while(queue.size() > 0) {
            unsigned int index = queue.front();
            queue.erase(queue.begin());

            // Terminals come first in symbol order, then non-terminals.
            for(unsigned int i=0; i<symbolCount; i++) {
                Grammar::Symbol symbol = mGrammar.symbolAt(i);
                ItemSet newItems = mItems.computeGoto(mStates[index].items, symbol);
                if(newItems.empty()) {
                    continue;
                }

                unsigned int target;
                auto it = known.find(newItems);
                if(it != known.end()) {
                    target = it->second;
                } else {
                    target = (unsigned int)mStates.size();
                    if(target >= limit) {
                        throw InternalError("automaton construction did not reach a fixpoint");
                    }
                    known[newItems] = target;
                    queue.push_back(target);
                    mStates.push_back(State{target, std::move(newItems), {}});
                }

                mStates[index].transitions[i] = target;
                mTransitions.push_back(Transition{index, target, symbol});
            }
        }
    }
}
