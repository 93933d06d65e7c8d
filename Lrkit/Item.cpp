#include "Lrkit/Item.hpp"
#include "Lrkit/Errors.hpp"

#include <vector>

namespace Lrkit {

    bool Item::operator<(const Item &other) const {
        if(production < other.production) return true;
        if(production > other.production) return false;
        if(pos < other.pos) return true;
        return false;
    }

    bool Item::operator==(const Item &other) const {
        return production == other.production && pos == other.pos;
    }

    Items::Items(const Grammar &grammar)
    : mGrammar(grammar)
    {
    }

    const Grammar &Items::grammar() const
    {
        return mGrammar;
    }

    bool Items::isComplete(const Item &item) const
    {
        return item.pos >= mGrammar.productions()[item.production].rhs.size();
    }

    const Grammar::Symbol *Items::nextSymbol(const Item &item) const
    {
        const Grammar::RHS &rhs = mGrammar.productions()[item.production].rhs;
        if(item.pos < rhs.size()) {
            return &rhs[item.pos];
        }
        return nullptr;
    }

    unsigned int Items::universeSize() const
    {
        unsigned int size = 0;
        for(const auto &production : mGrammar.productions()) {
            size += (unsigned int)production.rhs.size() + 1;
        }
        return size;
    }

    ItemSet Items::computeClosure(const ItemSet &items) const
    {
        ItemSet result = items;
        std::vector<Item> queue(items.begin(), items.end());
        const unsigned int limit = universeSize();

        auto addItem = [&](const Item &item) {
            if(result.count(item) == 0) {
                result.insert(item);
                queue.push_back(item);
            }
        };

        // Each item is queued at most once, so the loop runs at most |universe| times.
        unsigned int iterations = 0;
        while(queue.size() > 0) {
            if(++iterations > limit + items.size()) {
                throw InternalError("closure did not reach a fixpoint");
            }

            Item item = queue.front();
            queue.erase(queue.begin());

            const Grammar::Symbol *symbol = nextSymbol(item);
            if(symbol && symbol->type == Grammar::Symbol::Type::Nonterminal) {
                for(unsigned int i=0; i<mGrammar.productions().size(); i++) {
                    if(mGrammar.productions()[i].lhs == symbol->index) {
                        addItem(Item{i, 0});
                    }
                }
            }
        }

        return result;
    }

    ItemSet Items::computeGoto(const ItemSet &items, const Grammar::Symbol &symbol) const
    {
        ItemSet kernel;
        for(const auto &item : items) {
            const Grammar::Symbol *next = nextSymbol(item);
            if(next && *next == symbol) {
                kernel.insert(Item{item.production, item.pos + 1});
            }
        }

        if(kernel.empty()) {
            return kernel;
        }

        return computeClosure(kernel);
    }

    std::string Items::itemString(const Item &item) const
    {
        const Grammar::Production &production = mGrammar.productions()[item.production];
        std::string result = mGrammar.nonterminals()[production.lhs] + " →";
        for(unsigned int i=0; i<=production.rhs.size(); i++) {
            if(i == item.pos) {
                result += " •";
            }
            if(i == production.rhs.size()) {
                break;
            }
            result += " " + mGrammar.name(production.rhs[i]);
        }
        return result;
    }
}
