#include "Lrkit/ParseTable.hpp"

#include <cctype>

namespace Lrkit {

    bool ParseTable::Action::operator==(const Action &other) const
    {
        if(type != other.type) return false;
        if(type == Type::Error || type == Type::Accept) return true;
        return index == other.index;
    }

    bool ParseTable::Action::operator!=(const Action &other) const
    {
        return !(*this == other);
    }

    std::string ParseTable::Action::toString() const
    {
        switch(type) {
            case Type::Shift:
                return "s" + std::to_string(index);
            case Type::Reduce:
                return "r" + std::to_string(index);
            case Type::Accept:
                return "acc";
            case Type::Error:
            default:
                return "";
        }
    }

    ParseTable::Action ParseTable::Action::parse(const std::string &text)
    {
        if(text == "acc" || text == "accept") {
            return Action{Type::Accept, 0};
        }

        if(text.size() < 2 || (text[0] != 's' && text[0] != 'r')) {
            return Action{Type::Error, 0};
        }

        unsigned int index = 0;
        for(unsigned int i=1; i<text.size(); i++) {
            if(!std::isdigit((unsigned char)text[i])) {
                return Action{Type::Error, 0};
            }
            index = index * 10 + (unsigned int)(text[i] - '0');
        }

        return Action{text[0] == 's' ? Type::Shift : Type::Reduce, index};
    }

    ParseTable::ReduceLookahead ParseTable::allTerminals(const Grammar &grammar)
    {
        std::set<unsigned int> terminals;
        for(unsigned int i=0; i<grammar.terminals().size(); i++) {
            terminals.insert(i);
        }

        return [terminals](unsigned int) {
            return terminals;
        };
    }

    ParseTable::ReduceLookahead ParseTable::followSet(const Grammar &grammar, const FirstFollow &sets)
    {
        return [&grammar, &sets](unsigned int production) {
            return sets.follow(grammar.productions()[production].lhs);
        };
    }

    ParseTable::ParseTable(const Automaton &automaton, ReduceLookahead reduceLookahead)
    : mGrammar(automaton.grammar())
    {
        computeParseTable(automaton, reduceLookahead);
    }

    const Grammar &ParseTable::grammar() const
    {
        return mGrammar;
    }

    unsigned int ParseTable::stateCount() const
    {
        return (unsigned int)mActions.rows();
    }

    const ParseTable::Action &ParseTable::action(unsigned int state, unsigned int terminal) const
    {
        return mActions.at(state, terminal);
    }

    std::optional<unsigned int> ParseTable::gotoState(unsigned int state, unsigned int nonterminal) const
    {
        unsigned int target = mGotos.at(state, nonterminal);
        if(target == Grammar::kInvalidIndex) {
            return std::nullopt;
        }
        return target;
    }

    const std::vector<ParseTable::Conflict> &ParseTable::conflicts() const
    {
        return mConflicts;
    }

    std::vector<ParseTable::Conflict> ParseTable::conflicts(Conflict::Type type) const
    {
        std::vector<Conflict> result;
        for(const Conflict &conflict : mConflicts) {
            if(conflict.type == type) {
                result.push_back(conflict);
            }
        }
        return result;
    }

    bool ParseTable::conflictFree() const
    {
        return mConflicts.empty();
    }

    // The first action written to a cell stays; later differing actions are recorded as conflicts.
    void ParseTable::setAction(unsigned int state, unsigned int terminal, const Action &action)
    {
        Action &cell = mActions.at(state, terminal);
        if(cell.type == Action::Type::Error) {
            cell = action;
            return;
        }

        if(cell == action) {
            return;
        }

        Conflict conflict;
        if(cell.type == Action::Type::Shift || action.type == Action::Type::Shift) {
            conflict.type = Conflict::Type::ShiftReduce;
        } else {
            conflict.type = Conflict::Type::ReduceReduce;
        }
        conflict.state = state;
        conflict.terminal = terminal;
        conflict.kept = cell;
        conflict.discarded = action;
        mConflicts.push_back(conflict);
    }

    void ParseTable::computeParseTable(const Automaton &automaton, ReduceLookahead reduceLookahead)
    {
        const std::vector<Automaton::State> &states = automaton.states();
        const Items &items = automaton.items();

        mActions.resize(states.size(), mGrammar.terminals().size(), Action{Action::Type::Error, 0});
        mGotos.resize(states.size(), mGrammar.nonterminals().size(), Grammar::kInvalidIndex);

        for(unsigned int i=0; i<states.size(); i++) {
            // Shifts first, then reductions; both in item order.
            for(const auto &item : states[i].items) {
                const Grammar::Symbol *symbol = items.nextSymbol(item);
                if(symbol && symbol->type == Grammar::Symbol::Type::Terminal) {
                    std::optional<unsigned int> target = automaton.transition(i, *symbol);
                    if(target) {
                        setAction(i, symbol->index, Action{Action::Type::Shift, *target});
                    }
                }
            }

            for(const auto &item : states[i].items) {
                if(!items.isComplete(item)) {
                    continue;
                }

                if(item.production == 0) {
                    setAction(i, mGrammar.endMarker(), Action{Action::Type::Accept, 0});
                    continue;
                }

                for(unsigned int terminal : reduceLookahead(item.production)) {
                    setAction(i, terminal, Action{Action::Type::Reduce, item.production});
                }
            }

            for(unsigned int n=0; n<mGrammar.nonterminals().size(); n++) {
                std::optional<unsigned int> target = automaton.transition(i, Grammar::Symbol{Grammar::Symbol::Type::Nonterminal, n});
                if(target) {
                    mGotos.at(i, n) = *target;
                }
            }
        }
    }
}
