/*
    bftool - A bounded brainfuck interpreter
    Tape dump helper
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
#include <vector>

#include "cpp-terminal/color.hpp"

namespace bftool {

// Prints cells up to the last non-zero one (or the cursor, whichever is
// further), ten per row, with the cursor cell highlighted.
inline void dumpMemory(const std::vector<std::uint8_t>& cells, size_t cellPtr,
                       std::ostream& out = std::cout, bool color = true) {
    if (cells.empty()) {
        out << "Memory dump:" << '\n' << "<empty>" << std::endl;
        return;
    }
    size_t lastNonEmpty = cells.size() - 1;
    while (lastNonEmpty > cellPtr && lastNonEmpty > 0 && !cells[lastNonEmpty]) {
        --lastNonEmpty;
    }
    out << "Memory dump:" << '\n' << "row+col |0  |1  |2  |3  |4  |5  |6  |7  |8  |9  |" << std::endl;
    const size_t end = std::max(lastNonEmpty, std::min(cellPtr, cells.size() - 1));
    for (size_t i = 0, row = 0; i <= end; ++i) {
        if (i % 10 == 0) {
            if (row) out << std::endl;
            std::string rowStr = std::to_string(row);
            size_t rowPad = rowStr.length() < 8 ? 8 - rowStr.length() : 0;
            out << rowStr << std::string(rowPad, ' ') << "|";
            row += 10;
        }
        std::string cellStr = std::to_string(cells[i]);
        size_t cellPad = cellStr.length() < 3 ? 3 - cellStr.length() : 0;
        if (i == cellPtr && color) {
            out << Term::color_fg(Term::Color::Name::Green) << cellStr
                << Term::color_fg(Term::Color::Name::Default);
        } else if (i == cellPtr) {
            out << '*' << cellStr;
            if (cellPad) --cellPad;
        } else {
            out << cellStr;
        }
        out << std::string(cellPad, ' ') << "|";
    }
    out << std::endl;
}

}  // namespace bftool
