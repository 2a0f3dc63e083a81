#pragma once

#include <xxhash.h>

#include <cassert>
#include <cstdint>
#include <string>
#include <string_view>

#include "vm.hxx"

inline std::uint64_t hashOutput(std::string_view s) { return XXH64(s.data(), s.size(), 0); }

// Runs on a fresh interpreter and asserts success.
inline std::string runOk(std::string_view code, std::string_view input = "",
                         bftool::Config cfg = {}) {
    auto interp = bftool::Interpreter::create(cfg);
    assert(interp.ok());
    auto result = interp.value().run(code, input);
    assert(result.ok());
    return result.value();
}

// Runs on a fresh interpreter and returns the error it must fail with.
inline bftool::Error runErr(std::string_view code, std::string_view input = "",
                            bftool::Config cfg = {}) {
    auto interp = bftool::Interpreter::create(cfg);
    assert(interp.ok());
    auto result = interp.value().run(code, input);
    assert(!result.ok());
    return result.error();
}

// 'Hello World!\n' from the Wikipedia example
inline constexpr std::string_view kHelloWorld =
    "++++++++[>++++[>++>+++>+++>+<<<<-]>+>+>->>+[<]<-]>>.>---.+++++++..+++.>>.<-.<.+++.------."
    "--------.>>+.>++.";
