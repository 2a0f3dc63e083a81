/*
    bftool - A bounded brainfuck interpreter
    Error rendering
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <string>

#include "vm.hxx"

namespace bftool {

bool operator==(const Error& a, const Error& b) noexcept {
    return a.kind == b.kind && a.position == b.position && a.limit == b.limit &&
           a.tapeSize == b.tapeSize;
}

std::string describe(const Error& err) {
    switch (err.kind) {
        case ErrorKind::Configuration:
            return "tape_size must be > 0 (got " + std::to_string(err.tapeSize) + ")";
        case ErrorKind::UnmatchedOpen:
            return "Unmatched '[' at position " + std::to_string(err.position);
        case ErrorKind::UnmatchedClose:
            return "Unmatched ']' at position " + std::to_string(err.position);
        case ErrorKind::StepLimitExceeded:
            return "Max steps exceeded (" + std::to_string(err.limit) +
                   "). There may be an infinite loop. Use --max-steps to raise it.";
        case ErrorKind::Cancelled:
            return "Execution cancelled after " + std::to_string(err.limit) + " steps";
    }
    return "Unknown error";
}

}  // namespace bftool
