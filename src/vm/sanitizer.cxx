/*
    bftool - A bounded brainfuck interpreter
    Source sanitizer and tokenizer
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <simde/x86/sse2.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "vm.hxx"

#define TZCNT32(x) __builtin_ctz((unsigned)(x))

namespace {
constexpr std::array<char, 8> kCommands{'+', '-', '>', '<', '[', ']', '.', ','};

// 0xFF marks bytes that are not commands.
constexpr std::array<uint8_t, 256> charToOpcode = [] {
    std::array<uint8_t, 256> table{};
    table.fill(0xFF);
    table[static_cast<unsigned char>('>')] = static_cast<uint8_t>(insType::PTR_RGT);
    table[static_cast<unsigned char>('<')] = static_cast<uint8_t>(insType::PTR_LFT);
    table[static_cast<unsigned char>('+')] = static_cast<uint8_t>(insType::INC);
    table[static_cast<unsigned char>('-')] = static_cast<uint8_t>(insType::DEC);
    table[static_cast<unsigned char>('.')] = static_cast<uint8_t>(insType::PUT_CHR);
    table[static_cast<unsigned char>(',')] = static_cast<uint8_t>(insType::RAD_CHR);
    table[static_cast<unsigned char>('[')] = static_cast<uint8_t>(insType::JMP_ZER);
    table[static_cast<unsigned char>(']')] = static_cast<uint8_t>(insType::JMP_NOT_ZER);
    return table;
}();

constexpr std::array<char, 8> opcodeToChar{'>', '<', '+', '-', '.', ',', '[', ']'};

// Bitmask of the command bytes among the 16 bytes at p.
inline unsigned commandMask16(const char* p) {
    const simde__m128i chunk = simde_mm_loadu_si128(reinterpret_cast<const simde__m128i*>(p));
    simde__m128i hits = simde_mm_setzero_si128();
    for (char c : kCommands) {
        hits = simde_mm_or_si128(hits, simde_mm_cmpeq_epi8(chunk, simde_mm_set1_epi8(c)));
    }
    return static_cast<unsigned>(simde_mm_movemask_epi8(hits));
}
}  // namespace

namespace bftool {

bool isCommand(char c) noexcept { return charToOpcode[static_cast<unsigned char>(c)] != 0xFF; }

std::string sanitize(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    const char* p = text.data();
    const size_t n = text.size();
    size_t i = 0;
    for (; i + 16 <= n; i += 16) {
        unsigned mask = commandMask16(p + i);
        if (mask == 0xFFFFu) {
            out.append(p + i, 16);
            continue;
        }
        while (mask) {
            out.push_back(p[i + TZCNT32(mask)]);
            mask &= mask - 1;
        }
    }
    for (; i < n; ++i) {
        if (isCommand(p[i])) out.push_back(p[i]);
    }
    return out;
}

Program tokenize(std::string_view text) {
    const std::string clean = sanitize(text);
    Program program;
    program.reserve(clean.size());
    for (char c : clean) {
        program.push_back(static_cast<insType>(charToOpcode[static_cast<unsigned char>(c)]));
    }
    return program;
}

std::string render(const Program& program) {
    std::string out;
    out.reserve(program.size());
    for (insType op : program) out.push_back(opcodeToChar[static_cast<size_t>(op)]);
    return out;
}

}  // namespace bftool
