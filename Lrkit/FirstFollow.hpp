#ifndef LRKIT_FIRSTFOLLOW_HPP
#define LRKIT_FIRSTFOLLOW_HPP

#include "Lrkit/Grammar.hpp"

#include <set>
#include <vector>

namespace Lrkit {

    // FIRST and FOLLOW sets of an augmented grammar. Sets hold terminal indices;
    // kEpsilon stands for the empty string and only ever appears in FIRST sets.
    class FirstFollow
    {
    public:
        typedef std::set<unsigned int> TerminalSet;

        static constexpr unsigned int kEpsilon = Grammar::kInvalidIndex;

        FirstFollow(const Grammar &grammar);

        const TerminalSet &first(const Grammar::Symbol &symbol) const;
        const TerminalSet &follow(unsigned int nonterminal) const;

        TerminalSet firstOfString(Grammar::RHS::const_iterator begin, Grammar::RHS::const_iterator end) const;

    private:
        void computeFirstSets();
        void computeFollowSets();

        const Grammar &mGrammar;
        std::vector<TerminalSet> mTerminalFirstSets;
        std::vector<TerminalSet> mFirstSets;
        std::vector<TerminalSet> mFollowSets;
    };
}

#endif
