#include "GrammarReader.hpp"
#include "Lrkit/Errors.hpp"

#include <cctype>
#include <sstream>

static std::string trim(const std::string &text)
{
    size_t first = text.find_first_not_of(" \t\r");
    if(first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

GrammarReader::GrammarReader(std::istream &input)
{
    read(input);
}

GrammarReader::GrammarReader(const std::string &text)
{
    std::istringstream input(text);
    read(input);
}

bool GrammarReader::valid() const
{
    return mValid;
}

const Lrkit::Grammar &GrammarReader::grammar() const
{
    return *mGrammar;
}

const std::vector<Lrkit::Grammar::Rule> &GrammarReader::rules() const
{
    return mRules;
}

const GrammarReader::ParseError &GrammarReader::parseError() const
{
    return mParseError;
}

void GrammarReader::setError(unsigned int line, const std::string &message)
{
    mValid = false;
    mParseError.line = line;
    mParseError.message = message;
}

void GrammarReader::read(std::istream &input)
{
    mValid = true;
    mParseError = ParseError{0, ""};

    std::string line;
    unsigned int lineNumber = 0;
    while(std::getline(input, line)) {
        lineNumber++;
        line = trim(line);
        if(line.empty() || line[0] == '#') {
            continue;
        }

        if(!readLine(line, lineNumber)) {
            return;
        }
    }

    if(mRules.empty()) {
        setError(lineNumber, "grammar has no productions");
        return;
    }

    try {
        mGrammar = std::make_unique<Lrkit::Grammar>(mRules, mRules[0].lhs);
    } catch(const Lrkit::InvalidGrammarError &e) {
        setError(0, e.what());
    }
}

bool GrammarReader::readLine(const std::string &line, unsigned int lineNumber)
{
    std::string arrow = "->";
    size_t split = line.find(arrow);
    if(split == std::string::npos) {
        arrow = "→";
        split = line.find(arrow);
    }
    if(split == std::string::npos) {
        setError(lineNumber, "expected '->' in \"" + line + "\"");
        return false;
    }

    std::string lhs = trim(line.substr(0, split));
    if(lhs.empty()) {
        setError(lineNumber, "missing left-hand side");
        return false;
    }
    for(char c : lhs) {
        if(std::isspace((unsigned char)c)) {
            setError(lineNumber, "left-hand side '" + lhs + "' is not a single symbol");
            return false;
        }
    }

    std::string rhs = line.substr(split + arrow.size());

    // Split alternatives on '|' outside quotes. A quote only opens at the start of a symbol, so E' stays a name.
    std::vector<std::string> alternatives;
    std::string current;
    char quote = 0;
    for(char c : rhs) {
        if(quote) {
            if(c == quote) {
                quote = 0;
            }
            current.push_back(c);
        } else if((c == '"' || c == '\'') && (current.empty() || std::isspace((unsigned char)current.back()))) {
            quote = c;
            current.push_back(c);
        } else if(c == '|') {
            alternatives.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if(quote) {
        setError(lineNumber, "unterminated quote");
        return false;
    }
    alternatives.push_back(current);

    for(const std::string &alternative : alternatives) {
        std::vector<std::string> symbols;
        if(!splitSymbols(alternative, symbols, lineNumber)) {
            return false;
        }

        if(symbols.empty()) {
            setError(lineNumber, "empty alternative for '" + lhs + "' (write ε for an empty production)");
            return false;
        }

        if(symbols.size() == 1 && (symbols[0] == Lrkit::Grammar::kEpsilon || symbols[0] == "epsilon")) {
            symbols.clear();
        }

        mRules.push_back(Lrkit::Grammar::Rule{lhs, std::move(symbols)});
    }

    return true;
}

bool GrammarReader::splitSymbols(const std::string &text, std::vector<std::string> &symbols, unsigned int lineNumber)
{
    std::string current;
    char quote = 0;
    for(char c : text) {
        if(quote) {
            if(c == quote) {
                quote = 0;
            }
            current.push_back(c);
        } else if((c == '"' || c == '\'') && (current.empty() || std::isspace((unsigned char)current.back()))) {
            quote = c;
            current.push_back(c);
        } else if(std::isspace((unsigned char)c)) {
            if(!current.empty()) {
                symbols.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }

    if(quote) {
        setError(lineNumber, "unterminated quote");
        return false;
    }
    if(!current.empty()) {
        symbols.push_back(current);
    }

    return true;
}
