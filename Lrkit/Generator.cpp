#include "Lrkit/Generator.hpp"

namespace Lrkit {

    const char *parserTypeName(ParserType type)
    {
        switch(type) {
            case ParserType::SLR1:
                return "SLR(1)";
            case ParserType::LR0:
            default:
                return "LR(0)";
        }
    }

    bool parserTypeFromName(const std::string &name, ParserType &type)
    {
        if(name == "lr0") {
            type = ParserType::LR0;
            return true;
        }
        if(name == "slr1") {
            type = ParserType::SLR1;
            return true;
        }
        return false;
    }

    Generator::Generator(const Grammar &grammar, ParserType type)
    : mType(type), mGrammar(grammar.augmented())
    {
        mAutomaton = std::make_unique<Automaton>(mGrammar);

        switch(mType) {
            case ParserType::LR0:
                mTable = std::make_unique<ParseTable>(*mAutomaton, ParseTable::allTerminals(mGrammar));
                break;

            case ParserType::SLR1:
                mFirstFollow = std::make_unique<FirstFollow>(mGrammar);
                mTable = std::make_unique<ParseTable>(*mAutomaton, ParseTable::followSet(mGrammar, *mFirstFollow));
                break;
        }
    }

    ParserType Generator::type() const
    {
        return mType;
    }

    const Grammar &Generator::grammar() const
    {
        return mGrammar;
    }

    const Automaton &Generator::automaton() const
    {
        return *mAutomaton;
    }

    const ParseTable &Generator::table() const
    {
        return *mTable;
    }

    const FirstFollow *Generator::firstFollow() const
    {
        return mFirstFollow.get();
    }

    bool Generator::valid() const
    {
        return mTable->conflictFree();
    }

    void Generator::print(std::ostream &stream) const
    {
        const std::vector<Automaton::State> &states = mAutomaton->states();
        const Items &items = mAutomaton->items();

        for(unsigned int i=0; i<states.size(); i++) {
            stream << "State " << i << ":" << std::endl;
            for(const auto &item : states[i].items) {
                stream << "  " << items.itemString(item);
                if(items.isComplete(item)) {
                    stream << "  [ ";
                    for(unsigned int t=0; t<mGrammar.terminals().size(); t++) {
                        const ParseTable::Action &action = mTable->action(i, t);
                        if(action.type == ParseTable::Action::Type::Reduce && action.index == item.production) {
                            stream << mGrammar.terminals()[t] << " ";
                        }
                    }
                    stream << "]";
                }
                stream << std::endl;
            }
            stream << std::endl;
            for(const auto &transition : states[i].transitions) {
                stream << "  " << mGrammar.name(mGrammar.symbolAt(transition.first)) << " -> " << transition.second << std::endl;
            }
            stream << std::endl;
        }

        for(const ParseTable::Conflict &conflict : mTable->conflicts()) {
            stream << (conflict.type == ParseTable::Conflict::Type::ShiftReduce ? "Shift/Reduce" : "Reduce/Reduce")
                   << " conflict in state " << conflict.state
                   << " on " << mGrammar.terminals()[conflict.terminal]
                   << ": " << conflict.kept.toString() << " kept, " << conflict.discarded.toString() << " discarded" << std::endl;
        }
    }
}
