#include "Lrkit/Engine.hpp"
#include "Lrkit/Errors.hpp"

#include <iterator>

namespace Lrkit {

    bool ParseNode::isTerminal() const
    {
        return production == kNoProduction;
    }

    std::vector<std::string> ParseNode::leaves() const
    {
        std::vector<std::string> result;
        if(isTerminal()) {
            result.push_back(symbol);
            return result;
        }

        for(const ParseNode &child : children) {
            std::vector<std::string> childLeaves = child.leaves();
            result.insert(result.end(), childLeaves.begin(), childLeaves.end());
        }
        return result;
    }

    ParseRejectedError::ParseRejectedError(unsigned int state, const std::string &token, size_t position, std::vector<Step> &&steps)
    : std::runtime_error("No action for state " + std::to_string(state) + " and token '" + token + "' at position " + std::to_string(position)),
      mState(state), mToken(token), mPosition(position), mSteps(std::move(steps))
    {
    }

    unsigned int ParseRejectedError::state() const
    {
        return mState;
    }

    const std::string &ParseRejectedError::token() const
    {
        return mToken;
    }

    size_t ParseRejectedError::position() const
    {
        return mPosition;
    }

    const std::vector<Step> &ParseRejectedError::steps() const
    {
        return mSteps;
    }

    Engine::Engine(const ParseTable &table)
    : mTable(table), mGrammar(table.grammar())
    {
        mTrace = nullptr;
        mMaxSteps = 100000;
    }

    void Engine::setTrace(std::ostream *stream)
    {
        mTrace = stream;
    }

    void Engine::setMaxSteps(size_t steps)
    {
        mMaxSteps = steps;
    }

    void Engine::trace(const Step &step) const
    {
        if(!mTrace) {
            return;
        }

        *mTrace << step.index << ": [";
        for(unsigned int i=0; i<step.states.size(); i++) {
            if(i > 0) {
                *mTrace << " " << step.symbols[i - 1] << " ";
            }
            *mTrace << step.states[i];
        }
        *mTrace << "] ";
        for(const std::string &token : step.input) {
            *mTrace << token << " ";
        }
        *mTrace << "| " << step.message << std::endl;
    }

    ParseResult Engine::parse(const std::vector<std::string> &tokens) const
    {
        std::vector<std::string> input = tokens;
        input.push_back(Grammar::kEndMarker);

        std::vector<unsigned int> states;
        std::vector<std::string> symbols;
        std::vector<ParseNode> nodes;
        std::vector<Step> steps;
        size_t position = 0;

        states.push_back(0);

        while(true) {
            if(steps.size() >= mMaxSteps) {
                throw InternalError("parse exceeded " + std::to_string(mMaxSteps) + " steps");
            }

            unsigned int state = states.back();
            const std::string &token = input[position];

            // Tokens that are not terminals of the grammar have no ACTION entry anywhere.
            ParseTable::Action action{ParseTable::Action::Type::Error, 0};
            unsigned int terminal = mGrammar.terminalIndex(token);
            if(terminal != Grammar::kInvalidIndex && (position + 1 == input.size() || terminal != mGrammar.endMarker())) {
                action = mTable.action(state, terminal);
            }

            Step step;
            step.index = (unsigned int)steps.size() + 1;
            step.action = action;
            step.state = state;
            step.token = token;
            step.states = states;
            step.symbols = symbols;
            step.input.assign(input.begin() + position, input.end());

            switch(action.type) {
                case ParseTable::Action::Type::Error:
                {
                    step.message = "No action for state " + std::to_string(state) + " and token '" + token + "'";
                    trace(step);
                    steps.push_back(std::move(step));
                    throw ParseRejectedError(state, token, position, std::move(steps));
                }

                case ParseTable::Action::Type::Shift:
                {
                    step.message = "Shift " + token + ", goto state " + std::to_string(action.index);
                    trace(step);
                    steps.push_back(std::move(step));

                    states.push_back(action.index);
                    symbols.push_back(token);
                    nodes.push_back(ParseNode{token, ParseNode::kNoProduction, "", {}});
                    position++;
                    break;
                }

                case ParseTable::Action::Type::Reduce:
                {
                    const Grammar::Production &production = mGrammar.productions()[action.index];
                    const std::string &lhs = mGrammar.nonterminals()[production.lhs];
                    size_t length = production.rhs.size();
                    if(length > symbols.size()) {
                        throw InternalError("parse stack underflow reducing " + mGrammar.productionString(action.index));
                    }

                    unsigned int exposed = states[states.size() - 1 - length];
                    std::optional<unsigned int> target = mTable.gotoState(exposed, production.lhs);
                    if(!target) {
                        throw InternalError("no GOTO entry for state " + std::to_string(exposed) + " and " + lhs);
                    }

                    step.production = mGrammar.productionString(action.index);
                    step.message = "Reduce " + step.production + ", goto state " + std::to_string(*target);
                    trace(step);
                    steps.push_back(std::move(step));

                    ParseNode node{lhs, action.index, mGrammar.productionString(action.index), {}};
                    node.children.assign(std::make_move_iterator(nodes.end() - length), std::make_move_iterator(nodes.end()));
                    nodes.resize(nodes.size() - length);
                    states.resize(states.size() - length);
                    symbols.resize(symbols.size() - length);

                    states.push_back(*target);
                    symbols.push_back(lhs);
                    nodes.push_back(std::move(node));
                    break;
                }

                case ParseTable::Action::Type::Accept:
                {
                    step.message = "Accept";
                    trace(step);
                    steps.push_back(std::move(step));

                    if(nodes.size() != 1) {
                        throw InternalError("accepted with " + std::to_string(nodes.size()) + " trees on the stack");
                    }
                    return ParseResult{std::move(nodes.back()), std::move(steps)};
                }
            }
        }
    }
}
