#pragma once

#include <string>
#include <string_view>

namespace bftool {
bool isCommand(char c) noexcept;

// Keeps only +-<>[],. in their original order. Idempotent.
std::string sanitize(std::string_view text);

// sanitize() followed by a per-character opcode lookup.
Program tokenize(std::string_view text);

std::string render(const Program& program);
}  // namespace bftool
