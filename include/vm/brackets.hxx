#pragma once

#include <cstddef>
#include <limits>
#include <vector>

namespace bftool {

/// @brief Symmetric jump table between matching `[` and `]` positions.
///
/// Every bracket position of the program it was built from is a key and no
/// other position is. `at(at(p)) == p` for every key `p`.
class BracketMap {
   public:
    static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

    BracketMap() = default;
    explicit BracketMap(std::size_t programLength) : table(programLength, npos) {}

    bool contains(std::size_t pos) const noexcept {
        return pos < table.size() && table[pos] != npos;
    }
    // Unchecked; callers only look up positions holding a bracket.
    std::size_t at(std::size_t pos) const noexcept { return table[pos]; }
    std::size_t size() const noexcept { return keys; }
    std::size_t length() const noexcept { return table.size(); }

   private:
    friend Result<BracketMap> buildBracketMap(const Program& program);

    void link(std::size_t open, std::size_t close) {
        table[open] = close;
        table[close] = open;
        keys += 2;
    }

    std::vector<std::size_t> table;
    std::size_t keys = 0;
};

// Fails with UnmatchedClose at the first stray `]`, or UnmatchedOpen at the
// most recent `[` still open when the scan ends.
Result<BracketMap> buildBracketMap(const Program& program);

}  // namespace bftool
