#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace bftool {

enum class ErrorKind : uint8_t {
    Configuration,
    UnmatchedOpen,
    UnmatchedClose,
    StepLimitExceeded,
    Cancelled,
};

// Only the field matching `kind` is meaningful: `tapeSize` for Configuration,
// `position` for the bracket errors, `limit` for StepLimitExceeded and the
// number of steps reached for Cancelled.
struct Error {
    ErrorKind kind;
    std::size_t position = 0;
    std::uint64_t limit = 0;
    std::int64_t tapeSize = 0;

    static Error configuration(std::int64_t tapeSize) {
        return {ErrorKind::Configuration, 0, 0, tapeSize};
    }
    static Error unmatchedOpen(std::size_t pos) { return {ErrorKind::UnmatchedOpen, pos}; }
    static Error unmatchedClose(std::size_t pos) { return {ErrorKind::UnmatchedClose, pos}; }
    static Error stepLimit(std::uint64_t limit) {
        return {ErrorKind::StepLimitExceeded, 0, limit};
    }
    static Error cancelled(std::uint64_t steps) { return {ErrorKind::Cancelled, 0, steps}; }
};

bool operator==(const Error& a, const Error& b) noexcept;

/// @brief One-line human readable diagnostic for an error, without a trailing newline.
std::string describe(const Error& err);

/// @brief Either a value of type T or an Error. Errors travel by return, never by throwing.
template <typename T>
class Result {
   public:
    Result(T value) : data(std::move(value)) {}
    Result(Error err) : data(err) {}

    bool ok() const noexcept { return std::holds_alternative<T>(data); }
    explicit operator bool() const noexcept { return ok(); }

    T& value() & { return std::get<T>(data); }
    const T& value() const& { return std::get<T>(data); }
    T&& value() && { return std::get<T>(std::move(data)); }

    const Error& error() const { return std::get<Error>(data); }

   private:
    std::variant<T, Error> data;
};

}  // namespace bftool
