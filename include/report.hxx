/*
    bft - A brainfuck tape interpreter
    Tape dump
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include "ansi.hxx"
#include "vm.hxx"

namespace bft {

/// @brief Prints the tape ten cells per row up to the last non-zero cell or the head,
/// whichever is further. The cell under the head is highlighted, or bracketed without color.
template <typename CellT>
inline void dumpMemory(const Tape<CellT>& cells, size_t cellPtr, std::ostream& out = std::cout,
                       bool color = true) {
    if (cells.size() == 0) {
        out << "Memory dump:" << '\n' << "<empty>" << std::endl;
        return;
    }
    size_t lastNonEmpty = cells.size() - 1;
    while (lastNonEmpty > cellPtr && lastNonEmpty > 0 &&
           CellKind<CellT>::isZero(cells[lastNonEmpty])) {
        --lastNonEmpty;
    }
    const std::string_view under = color ? ansi::underline : std::string_view{};
    const std::string_view reset = color ? ansi::reset : std::string_view{};
    out << "Memory dump:" << '\n'
        << under << "row+col |0  |1  |2  |3  |4  |5  |6  |7  |8  |9  |" << reset << '\n';
    size_t end = std::max(lastNonEmpty, std::min(cellPtr, cells.size() - 1));
    for (size_t i = 0, row = 0; i <= end; ++i) {
        if (i % 10 == 0) {
            if (row) out << '\n';
            std::string rowStr = std::to_string(row);
            size_t rowPad = rowStr.length() < 8 ? 8 - rowStr.length() : 0;
            out << rowStr << std::string(rowPad, ' ') << "|";
            row += 10;
        }
        const bool atHead = color && i == cellPtr;
        std::string cellStr = std::to_string(CellKind<CellT>::getValue(cells[i]));
        if (!color && i == cellPtr) cellStr = '[' + cellStr + ']';
        size_t cellPad = cellStr.length() < 3 ? 3 - cellStr.length() : 0;
        if (atHead) out << ansi::green;
        out << cellStr;
        if (atHead) out << ansi::reset;
        out << std::string(cellPad, ' ') << "|";
    }
    out << reset << std::endl;
}

}  // namespace bft
