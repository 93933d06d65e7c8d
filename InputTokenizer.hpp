#ifndef INPUTTOKENIZER_HPP
#define INPUTTOKENIZER_HPP

#include <stdexcept>
#include <string>
#include <vector>

// Splits parser input on whitespace and single-character operators, and checks every
// token against the terminals of the grammar.
class InputTokenizer
{
public:
    struct Token {
        std::string text;
        unsigned int start;
    };

    class UnknownTokenError : public std::runtime_error {
    public:
        UnknownTokenError(const Token &token, const std::string &message);

        const Token &token() const;

    private:
        Token mToken;
    };

    static const char *const kOperators;

    InputTokenizer(const std::vector<std::string> &terminals);

    std::vector<Token> tokenize(const std::string &input) const;
    static std::vector<std::string> texts(const std::vector<Token> &tokens);

private:
    std::vector<Token> split(const std::string &input) const;
    bool isTerminal(const std::string &text) const;

    std::vector<std::string> mTerminals;
};

#endif
