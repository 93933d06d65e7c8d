#include "Lrkit/FirstFollow.hpp"
#include "Lrkit/Errors.hpp"

namespace Lrkit {

    namespace {
        void addSymbol(FirstFollow::TerminalSet &set, unsigned int symbol, bool &changed)
        {
            if(set.count(symbol) == 0) {
                set.insert(symbol);
                changed = true;
            }
        }

        void addSet(FirstFollow::TerminalSet &set, const FirstFollow::TerminalSet &source, bool &changed)
        {
            for(unsigned int s : source) {
                addSymbol(set, s, changed);
            }
        }

        void addSetWithoutEpsilon(FirstFollow::TerminalSet &set, const FirstFollow::TerminalSet &source, bool &changed)
        {
            for(unsigned int s : source) {
                if(s != FirstFollow::kEpsilon) {
                    addSymbol(set, s, changed);
                }
            }
        }
    }

    FirstFollow::FirstFollow(const Grammar &grammar)
    : mGrammar(grammar)
    {
        if(!mGrammar.isAugmented()) {
            throw InvalidGrammarError("FIRST/FOLLOW computation requires an augmented grammar");
        }

        computeFirstSets();
        computeFollowSets();
    }

    const FirstFollow::TerminalSet &FirstFollow::first(const Grammar::Symbol &symbol) const
    {
        switch(symbol.type) {
            case Grammar::Symbol::Type::Terminal:
                return mTerminalFirstSets.at(symbol.index);
            case Grammar::Symbol::Type::Nonterminal:
            default:
                return mFirstSets.at(symbol.index);
        }
    }

    const FirstFollow::TerminalSet &FirstFollow::follow(unsigned int nonterminal) const
    {
        return mFollowSets.at(nonterminal);
    }

    FirstFollow::TerminalSet FirstFollow::firstOfString(Grammar::RHS::const_iterator begin, Grammar::RHS::const_iterator end) const
    {
        TerminalSet result;
        bool changed = false;
        for(auto it = begin; it != end; it++) {
            const TerminalSet &symbolFirst = first(*it);
            addSetWithoutEpsilon(result, symbolFirst, changed);
            if(symbolFirst.count(kEpsilon) == 0) {
                return result;
            }
        }

        result.insert(kEpsilon);
        return result;
    }

    void FirstFollow::computeFirstSets()
    {
        mTerminalFirstSets.resize(mGrammar.terminals().size());
        for(unsigned int i=0; i<mGrammar.terminals().size(); i++) {
            mTerminalFirstSets[i].insert(i);
        }
        mFirstSets.resize(mGrammar.nonterminals().size());

        // Every productive pass adds at least one element, and each set is bounded by |terminals| + 1.
        const size_t limit = (mGrammar.terminals().size() + 1) * mGrammar.nonterminals().size() + 1;
        size_t passes = 0;

        bool changed = true;
        while(changed) {
            if(++passes > limit) {
                throw InternalError("FIRST sets did not reach a fixpoint");
            }

            changed = false;
            for(const Grammar::Production &production : mGrammar.productions()) {
                TerminalSet &target = mFirstSets[production.lhs];

                bool nullable = true;
                for(const Grammar::Symbol &symbol : production.rhs) {
                    const TerminalSet &symbolFirst = first(symbol);
                    addSetWithoutEpsilon(target, symbolFirst, changed);
                    if(symbolFirst.count(kEpsilon) == 0) {
                        nullable = false;
                        break;
                    }
                }

                if(nullable) {
                    addSymbol(target, kEpsilon, changed);
                }
            }
        }
    }

    void FirstFollow::computeFollowSets()
    {
        mFollowSets.resize(mGrammar.nonterminals().size());
        mFollowSets[mGrammar.productions()[0].lhs].insert(mGrammar.endMarker());

        const size_t limit = mGrammar.terminals().size() * mGrammar.nonterminals().size() + 1;
        size_t passes = 0;

        bool changed = true;
        while(changed) {
            if(++passes > limit) {
                throw InternalError("FOLLOW sets did not reach a fixpoint");
            }

            changed = false;
            for(const Grammar::Production &production : mGrammar.productions()) {
                for(auto it = production.rhs.cbegin(); it != production.rhs.cend(); it++) {
                    if(it->type != Grammar::Symbol::Type::Nonterminal) {
                        continue;
                    }

                    TerminalSet &target = mFollowSets[it->index];
                    TerminalSet rest = firstOfString(it + 1, production.rhs.cend());
                    addSetWithoutEpsilon(target, rest, changed);
                    if(rest.count(kEpsilon) > 0) {
                        // Copy first: target and FOLLOW(lhs) may be the same set.
                        TerminalSet lhsFollow = mFollowSets[production.lhs];
                        addSet(target, lhsFollow, changed);
                    }
                }
            }
        }
    }
}
