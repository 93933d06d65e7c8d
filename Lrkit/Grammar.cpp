#include "Lrkit/Grammar.hpp"
#include "Lrkit/Errors.hpp"

#include <algorithm>

namespace Lrkit {

    const char *const Grammar::kEndMarker = "$";
    const char *const Grammar::kEpsilon = "ε";

    static bool isReserved(const std::string &name)
    {
        return name == Grammar::kEndMarker || name == Grammar::kEpsilon || name == "epsilon";
    }

    bool Grammar::Symbol::operator<(const Symbol &other) const
    {
        if(type != other.type) return type < other.type;
        return index < other.index;
    }

    bool Grammar::Symbol::operator==(const Symbol &other) const
    {
        return type == other.type && index == other.index;
    }

    bool Grammar::Symbol::operator!=(const Symbol &other) const
    {
        return !(*this == other);
    }

    Grammar::Grammar(const std::vector<Rule> &rules, const std::string &startSymbol)
    {
        build(rules, startSymbol);

        mAugmentedStart = startSymbol + "'";
        while(nonterminalIndex(mAugmentedStart) != kInvalidIndex || terminalIndex(mAugmentedStart) != kInvalidIndex) {
            mAugmentedStart += "'";
        }
    }

    Grammar::Grammar(const std::vector<Rule> &rules, const std::string &startSymbol, const std::string &augmentedStart)
    {
        build(rules, startSymbol);
        mAugmentedStart = augmentedStart;
    }

    void Grammar::build(const std::vector<Rule> &rules, const std::string &startSymbol)
    {
        if(rules.empty()) {
            throw InvalidGrammarError("grammar has no productions");
        }

        // Every left-hand side is a non-terminal; classify them before looking at any right-hand side.
        for(const Rule &rule : rules) {
            if(rule.lhs.empty()) {
                throw InvalidGrammarError("production with an empty left-hand side");
            }
            if(isReserved(rule.lhs)) {
                throw InvalidGrammarError("reserved symbol '" + rule.lhs + "' used as a left-hand side");
            }
            if(std::find(mNonterminals.begin(), mNonterminals.end(), rule.lhs) == mNonterminals.end()) {
                mNonterminals.push_back(rule.lhs);
            }
        }

        for(const Rule &rule : rules) {
            for(const std::string &name : rule.rhs) {
                if(name.empty()) {
                    throw InvalidGrammarError("empty symbol in a production of '" + rule.lhs + "'");
                }
                if(isReserved(name)) {
                    throw InvalidGrammarError("reserved symbol '" + name + "' in a production of '" + rule.lhs + "'");
                }
                if(nonterminalIndex(name) == kInvalidIndex && terminalIndex(name) == kInvalidIndex) {
                    mTerminals.push_back(name);
                }
            }
        }
        mTerminals.push_back(kEndMarker);

        mStartSymbol = nonterminalIndex(startSymbol);
        if(mStartSymbol == kInvalidIndex) {
            throw InvalidGrammarError("start symbol '" + startSymbol + "' has no productions");
        }

        for(const Rule &rule : rules) {
            Production production;
            production.lhs = nonterminalIndex(rule.lhs);
            for(const std::string &name : rule.rhs) {
                unsigned int index = nonterminalIndex(name);
                if(index != kInvalidIndex) {
                    production.rhs.push_back(Symbol{Symbol::Type::Nonterminal, index});
                } else {
                    production.rhs.push_back(Symbol{Symbol::Type::Terminal, terminalIndex(name)});
                }
            }
            mProductions.push_back(std::move(production));
        }
    }

    Grammar Grammar::augmented() const
    {
        if(isAugmented()) {
            return *this;
        }

        std::vector<Rule> augmentedRules;
        augmentedRules.push_back(Rule{mAugmentedStart, {mNonterminals[mStartSymbol]}});
        for(Rule &rule : rules()) {
            augmentedRules.push_back(std::move(rule));
        }

        return Grammar(augmentedRules, mNonterminals[mStartSymbol], mAugmentedStart);
    }

    bool Grammar::isAugmented() const
    {
        return mNonterminals[mProductions[0].lhs] == mAugmentedStart;
    }

    const std::vector<Grammar::Production> &Grammar::productions() const
    {
        return mProductions;
    }

    const std::vector<std::string> &Grammar::terminals() const
    {
        return mTerminals;
    }

    const std::vector<std::string> &Grammar::nonterminals() const
    {
        return mNonterminals;
    }

    unsigned int Grammar::startSymbol() const
    {
        return mStartSymbol;
    }

    const std::string &Grammar::augmentedStartName() const
    {
        return mAugmentedStart;
    }

    unsigned int Grammar::endMarker() const
    {
        return (unsigned int)mTerminals.size() - 1;
    }

    unsigned int Grammar::terminalIndex(const std::string &name) const
    {
        for(unsigned int i=0; i<mTerminals.size(); i++) {
            if(mTerminals[i] == name) {
                return i;
            }
        }

        return kInvalidIndex;
    }

    unsigned int Grammar::nonterminalIndex(const std::string &name) const
    {
        for(unsigned int i=0; i<mNonterminals.size(); i++) {
            if(mNonterminals[i] == name) {
                return i;
            }
        }

        return kInvalidIndex;
    }

    const std::string &Grammar::name(const Symbol &symbol) const
    {
        switch(symbol.type) {
            case Symbol::Type::Terminal:
                return mTerminals.at(symbol.index);
            case Symbol::Type::Nonterminal:
            default:
                return mNonterminals.at(symbol.index);
        }
    }

    std::string Grammar::productionString(unsigned int production) const
    {
        const Production &p = mProductions.at(production);
        std::string result = mNonterminals[p.lhs] + " →";
        if(p.rhs.empty()) {
            result += " ";
            result += kEpsilon;
        }
        for(const Symbol &symbol : p.rhs) {
            result += " " + name(symbol);
        }
        return result;
    }

    std::vector<Grammar::Rule> Grammar::rules() const
    {
        std::vector<Rule> result;
        for(const Production &production : mProductions) {
            Rule rule;
            rule.lhs = mNonterminals[production.lhs];
            for(const Symbol &symbol : production.rhs) {
                rule.rhs.push_back(name(symbol));
            }
            result.push_back(std::move(rule));
        }
        return result;
    }

    unsigned int Grammar::symbolCount() const
    {
        return (unsigned int)(mTerminals.size() + mNonterminals.size());
    }

    unsigned int Grammar::symbolIndex(const Symbol &symbol) const
    {
        switch(symbol.type) {
            case Symbol::Type::Terminal:
                return symbol.index;
            case Symbol::Type::Nonterminal:
            default:
                return (unsigned int)mTerminals.size() + symbol.index;
        }
    }

    Grammar::Symbol Grammar::symbolAt(unsigned int index) const
    {
        if(index < mTerminals.size()) {
            return Symbol{Symbol::Type::Terminal, index};
        }
        return Symbol{Symbol::Type::Nonterminal, index - (unsigned int)mTerminals.size()};
    }
}
