#ifndef LRKIT_ITEM_HPP
#define LRKIT_ITEM_HPP

#include "Lrkit/Grammar.hpp"

#include <set>
#include <string>

namespace Lrkit {

    struct Item {
        bool operator<(const Item &other) const;
        bool operator==(const Item &other) const;

        unsigned int production;
        unsigned int pos;
    };

    // Ordered by (production, pos), which is also the display order.
    typedef std::set<Item> ItemSet;

    class Items
    {
    public:
        Items(const Grammar &grammar);

        const Grammar &grammar() const;

        bool isComplete(const Item &item) const;
        // Symbol after the dot, or nullptr when the dot is at the end.
        const Grammar::Symbol *nextSymbol(const Item &item) const;

        ItemSet computeClosure(const ItemSet &items) const;
        // GOTO(items, symbol); empty when no item advances over the symbol.
        ItemSet computeGoto(const ItemSet &items, const Grammar::Symbol &symbol) const;

        std::string itemString(const Item &item) const;

        // Upper bound on the number of distinct items of the grammar.
        unsigned int universeSize() const;

    private:
        const Grammar &mGrammar;
    };
}

#endif
