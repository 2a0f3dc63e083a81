#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bftool {

struct Config {
    std::int64_t tapeSize = BFTOOL_DEFAULT_TAPE_SIZE;
    std::uint64_t maxSteps = BFTOOL_DEFAULT_MAX_STEPS;
    // Polled once per step next to the step limit; null disables the check.
    const std::atomic<bool>* cancel = nullptr;
};

/// @brief Runs programs on a private circular tape of 8-bit cells.
///
/// Each instance owns its tape exclusively, so separate instances can run on
/// separate threads. The tape is cleared at the start of every run and keeps
/// its final contents afterwards for inspection.
class Interpreter {
   public:
    /// @brief Fails with ErrorKind::Configuration when cfg.tapeSize <= 0.
    static Result<Interpreter> create(const Config& cfg = {});

    /// @brief Sanitizes and executes `program`, feeding `,` from `input`.
    /// @param profile Optional; receives steps executed and elapsed time even on failure.
    /// @return The complete output, or the error that ended the run. Output produced before a
    /// failure is never returned.
    Result<std::string> run(std::string_view program, std::string_view input = {},
                            ProfileInfo* profile = nullptr);

    const std::vector<std::uint8_t>& tape() const noexcept { return cells; }
    std::size_t cursor() const noexcept { return cellPtr; }
    const Config& config() const noexcept { return settings; }

   private:
    explicit Interpreter(const Config& cfg);

    Result<std::string> execute(const Program& program, const BracketMap& brackets,
                                std::string_view input, std::uint64_t& steps);

    Config settings;
    std::vector<std::uint8_t> cells;
    std::size_t cellPtr = 0;
};

}  // namespace bftool
