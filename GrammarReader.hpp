#ifndef GRAMMARREADER_HPP
#define GRAMMARREADER_HPP

#include "Lrkit/Grammar.hpp"

#include <istream>
#include <memory>
#include <string>
#include <vector>

// Reads "A -> x y | z" lines into a Grammar. The first left-hand side is the start symbol.
class GrammarReader {
public:
    GrammarReader(std::istream &input);
    GrammarReader(const std::string &text);

    bool valid() const;

    const Lrkit::Grammar &grammar() const;
    const std::vector<Lrkit::Grammar::Rule> &rules() const;

    struct ParseError {
        unsigned int line;
        std::string message;
    };
    const ParseError &parseError() const;

private:
    void read(std::istream &input);
    bool readLine(const std::string &line, unsigned int lineNumber);
    bool splitSymbols(const std::string &text, std::vector<std::string> &symbols, unsigned int lineNumber);
    void setError(unsigned int line, const std::string &message);

    std::vector<Lrkit::Grammar::Rule> mRules;
    std::unique_ptr<Lrkit::Grammar> mGrammar;
    ParseError mParseError;
    bool mValid;
};
#endif
