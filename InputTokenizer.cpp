#include "InputTokenizer.hpp"
#include "Lrkit/Grammar.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

const char *const InputTokenizer::kOperators = "+-*/()=,;:.&|!<>";

InputTokenizer::UnknownTokenError::UnknownTokenError(const Token &token, const std::string &message)
: std::runtime_error(message), mToken(token)
{
}

const InputTokenizer::Token &InputTokenizer::UnknownTokenError::token() const
{
    return mToken;
}

InputTokenizer::InputTokenizer(const std::vector<std::string> &terminals)
{
    // The end marker is appended by the parser and never typed.
    for(const std::string &terminal : terminals) {
        if(terminal != Lrkit::Grammar::kEndMarker) {
            mTerminals.push_back(terminal);
        }
    }
}

bool InputTokenizer::isTerminal(const std::string &text) const
{
    return std::find(mTerminals.begin(), mTerminals.end(), text) != mTerminals.end();
}

std::vector<InputTokenizer::Token> InputTokenizer::split(const std::string &input) const
{
    std::vector<Token> tokens;
    Token current{"", 0};

    auto flush = [&]() {
        if(!current.text.empty()) {
            tokens.push_back(current);
            current.text.clear();
        }
    };

    for(unsigned int i=0; i<input.size(); i++) {
        char c = input[i];
        if(std::isspace((unsigned char)c)) {
            flush();
        } else if(c != '\0' && std::strchr(kOperators, c) != nullptr) {
            flush();
            tokens.push_back(Token{std::string(1, c), i});
        } else {
            if(current.text.empty()) {
                current.start = i;
            }
            current.text.push_back(c);
        }
    }
    flush();

    return tokens;
}

std::vector<InputTokenizer::Token> InputTokenizer::tokenize(const std::string &input) const
{
    std::vector<Token> tokens = split(input);
    for(const Token &token : tokens) {
        if(!isTerminal(token.text)) {
            std::string valid;
            for(const std::string &terminal : mTerminals) {
                valid += (valid.empty() ? "" : ", ") + terminal;
            }
            throw UnknownTokenError(token, "Unknown token '" + token.text + "' at position " + std::to_string(token.start) + ". Valid terminals: " + valid);
        }
    }

    return tokens;
}

std::vector<std::string> InputTokenizer::texts(const std::vector<Token> &tokens)
{
    std::vector<std::string> result;
    for(const Token &token : tokens) {
        result.push_back(token.text);
    }
    return result;
}
