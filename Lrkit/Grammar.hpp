#ifndef LRKIT_GRAMMAR_HPP
#define LRKIT_GRAMMAR_HPP

#include <string>
#include <vector>
#include <climits>

namespace Lrkit {

    class Grammar {
    public:
        struct Symbol {
            enum class Type {
                Terminal,
                Nonterminal
            };

            bool operator<(const Symbol &other) const;
            bool operator==(const Symbol &other) const;
            bool operator!=(const Symbol &other) const;

            Type type;
            unsigned int index;
        };

        typedef std::vector<Symbol> RHS;

        struct Production {
            unsigned int lhs;
            RHS rhs;
        };

        // Textual production as handed over by a reader; an empty rhs is an epsilon production.
        struct Rule {
            std::string lhs;
            std::vector<std::string> rhs;
        };

        static constexpr unsigned int kInvalidIndex = UINT_MAX;
        static const char *const kEndMarker;
        static const char *const kEpsilon;

        Grammar(const std::vector<Rule> &rules, const std::string &startSymbol);

        // Returns a copy with S' -> S prepended. Augmenting an augmented grammar returns it unchanged.
        Grammar augmented() const;
        bool isAugmented() const;

        const std::vector<Production> &productions() const;
        const std::vector<std::string> &terminals() const;
        const std::vector<std::string> &nonterminals() const;

        unsigned int startSymbol() const;
        const std::string &augmentedStartName() const;
        unsigned int endMarker() const;

        unsigned int terminalIndex(const std::string &name) const;
        unsigned int nonterminalIndex(const std::string &name) const;

        const std::string &name(const Symbol &symbol) const;
        std::string productionString(unsigned int production) const;
        std::vector<Rule> rules() const;

        // Terminals (including the end marker) occupy [0, terminals().size()), non-terminals follow.
        unsigned int symbolCount() const;
        unsigned int symbolIndex(const Symbol &symbol) const;
        Symbol symbolAt(unsigned int index) const;

    private:
        Grammar(const std::vector<Rule> &rules, const std::string &startSymbol, const std::string &augmentedStart);

        void build(const std::vector<Rule> &rules, const std::string &startSymbol);

        std::vector<Production> mProductions;
        std::vector<std::string> mTerminals;
        std::vector<std::string> mNonterminals;
        unsigned int mStartSymbol;
        std::string mAugmentedStart;
    };
}

#endif
