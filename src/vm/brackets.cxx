/*
    bftool - A bounded brainfuck interpreter
    Bracket matching
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <cstddef>
#include <vector>

#include "vm.hxx"

namespace bftool {

Result<BracketMap> buildBracketMap(const Program& program) {
    BracketMap brackets(program.size());
    std::vector<size_t> stack;
    for (size_t i = 0; i < program.size(); ++i) {
        const insType op = program[i];
        if (op == insType::JMP_ZER) {
            stack.push_back(i);
        } else if (op == insType::JMP_NOT_ZER) {
            if (stack.empty()) return Error::unmatchedClose(i);
            const size_t start = stack.back();
            stack.pop_back();
            brackets.link(start, i);
        }
    }
    // Innermost open bracket, not the leftmost one.
    if (!stack.empty()) return Error::unmatchedOpen(stack.back());
    return brackets;
}

}  // namespace bftool
