/*
    bftool - A bounded brainfuck interpreter
    VM implementation
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "vm.hxx"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bftool {

Interpreter::Interpreter(const Config& cfg)
    : settings(cfg), cells(static_cast<size_t>(cfg.tapeSize), 0) {}

Result<Interpreter> Interpreter::create(const Config& cfg) {
    if (cfg.tapeSize <= 0) return Error::configuration(cfg.tapeSize);
    return Interpreter(cfg);
}

Result<std::string> Interpreter::run(std::string_view program, std::string_view input,
                                     ProfileInfo* profile) {
    std::chrono::steady_clock::time_point start;
    if (profile) {
        profile->instructions = 0;
        start = std::chrono::steady_clock::now();
    }
    std::uint64_t steps = 0;
    const Program code = tokenize(program);
    auto brackets = buildBracketMap(code);
    if (!brackets) {
        if (profile)
            profile->seconds =
                std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        return brackets.error();
    }

    std::fill(cells.begin(), cells.end(), 0);
    cellPtr = 0;
    auto ret = execute(code, brackets.value(), input, steps);

    if (profile) {
        profile->instructions = steps;
        profile->seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    }
    return ret;
}

Result<std::string> Interpreter::execute(const Program& program, const BracketMap& brackets,
                                         std::string_view input, std::uint64_t& steps) {
    static void* jtable[] = {&&_PTR_RGT, &&_PTR_LFT, &&_INC,     &&_DEC,
                             &&_PUT_CHR, &&_RAD_CHR, &&_JMP_ZER, &&_JMP_NOT_ZER};

    const insType* code = program.data();
    const size_t length = program.size();
    const size_t tapeLen = cells.size();
    const std::uint64_t maxSteps = settings.maxSteps;
    const std::atomic<bool>* cancel = settings.cancel;
    std::uint8_t* __restrict cellBase = cells.data();
    size_t ptr = 0;
    size_t ip = 0;
    size_t inPos = 0;
    std::string out;

    // The step budget is checked before an instruction runs, so a program of
    // exactly maxSteps steps still completes.
#define DISPATCH()                                                       \
    if (ip >= length) goto _END;                                         \
    if (steps >= maxSteps) [[unlikely]]                                  \
        goto _STEP_LIMIT;                                                \
    if (cancel && cancel->load(std::memory_order_relaxed)) [[unlikely]] \
        goto _CANCELLED;                                                 \
    ++steps;                                                             \
    goto* jtable[static_cast<size_t>(code[ip])]
#define LOOP() \
    ++ip;      \
    DISPATCH()

    DISPATCH();

_PTR_RGT:
    if (++ptr == tapeLen) ptr = 0;
    LOOP();

_PTR_LFT:
    ptr = (ptr == 0 ? tapeLen : ptr) - 1;
    LOOP();

_INC:
    ++cellBase[ptr];
    LOOP();

_DEC:
    --cellBase[ptr];
    LOOP();

_PUT_CHR:
    out.push_back(static_cast<char>(cellBase[ptr]));
    LOOP();

_RAD_CHR:
    if (inPos < input.size()) {
        cellBase[ptr] = static_cast<std::uint8_t>(input[inPos++]);
    } else {
        cellBase[ptr] = 0;
    }
    LOOP();

_JMP_ZER:
    // Lands on the matching ']'; LOOP() then steps past it.
    if (!cellBase[ptr]) ip = brackets.at(ip);
    LOOP();

_JMP_NOT_ZER:
    if (cellBase[ptr]) [[likely]]
        ip = brackets.at(ip);
    LOOP();

#undef LOOP
#undef DISPATCH

_STEP_LIMIT:
    cellPtr = ptr;
    return Error::stepLimit(maxSteps);

_CANCELLED:
    cellPtr = ptr;
    return Error::cancelled(steps);

_END:
    cellPtr = ptr;
    return out;
}

}  // namespace bftool
