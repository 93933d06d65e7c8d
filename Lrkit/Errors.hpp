#ifndef LRKIT_ERRORS_HPP
#define LRKIT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Lrkit {

    // Malformed productions, reserved or undefined symbols, missing start symbol.
    class InvalidGrammarError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // A fixpoint or step guard tripped. Indicates a bug, never a bad input.
    class InternalError : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };
}

#endif
