/*
    bftool - A bounded brainfuck interpreter
    VM API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#define BFTOOL_DEFAULT_TAPE_SIZE 30000
#define BFTOOL_DEFAULT_MAX_STEPS 2000000
#define BFTOOL_TAPE_WARN_BYTES (1ull << 30)  // 1 GiB
// Hard limit to prevent uncontrolled memory allocation from user inputs.
// Requests exceeding this limit are rejected by the CLI.
#define BFTOOL_TAPE_MAX_BYTES (1ull << 31)  // 2 GiB

#include <cstddef>
#include <cstdint>
#include <vector>

enum class insType : uint8_t {
    PTR_RGT,
    PTR_LFT,
    INC,
    DEC,
    PUT_CHR,
    RAD_CHR,
    JMP_ZER,
    JMP_NOT_ZER,
};

namespace bftool {

using Program = std::vector<insType>;

struct ProfileInfo {
    std::uint64_t instructions = 0;
    double seconds = 0.0;
};

}  // namespace bftool

#include "vm/error.hxx"
#include "vm/sanitizer.hxx"
#include "vm/brackets.hxx"
#include "vm/executor.hxx"
