#ifndef UTIL_TABLE_HPP
#define UTIL_TABLE_HPP

#include <vector>
#include <stdexcept>

namespace Util {

    // Dense two-dimensional grid, addressed as at(row, column).
    template<typename T> class Table
    {
    public:
        Table()
        : mRows(0), mColumns(0)
        {
        }

        void resize(size_t rows, size_t columns, const T &defaultValue)
        {
            mRows = rows;
            mColumns = columns;
            mData.assign(rows * columns, defaultValue);
        }

        size_t rows() const
        {
            return mRows;
        }

        const T &at(unsigned int row, unsigned int column) const
        {
            check(row, column);
            return mData[row*mColumns + column];
        }

        T &at(unsigned int row, unsigned int column)
        {
            check(row, column);
            return mData[row*mColumns + column];
        }

    private:
        void check(unsigned int row, unsigned int column) const
        {
            if(row >= mRows || column >= mColumns) {
                throw std::out_of_range("Util::Table index out of range");
            }
        }

        size_t mRows;
        size_t mColumns;
        std::vector<T> mData;
    };
}
#endif
