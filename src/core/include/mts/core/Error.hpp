/**
 * @file Error.hpp
 * @brief Error codes, the Error value and Expected-based propagation.
 *
 * Every fallible operation of the engine and of the io layer returns
 * Expected<T>. Fatal conditions travel up through MTS_TRY; non-fatal ones
 * (an empty decade bin) are stored as Error values inside the report.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef MTS_CORE_ERROR_HPP
    #define MTS_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>
    #include <utility>

namespace mts::core {

/**
 * @brief Project-wide error code enumeration.
 */
enum class ErrorCode : u16 {
    kNone = 0,

    kInvalidInput,
    kInvalidArgument,
    kEmptyBin,

    kFileNotFound,
    kFileParseError,
    kIoError,

    kInternalError,
};

/**
 * @brief Returns a short human-readable label for the given error code.
 */
[[nodiscard]] constexpr std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::kNone:            return "None";
        case ErrorCode::kInvalidInput:    return "InvalidInput";
        case ErrorCode::kInvalidArgument: return "InvalidArgument";
        case ErrorCode::kEmptyBin:        return "EmptyBin";
        case ErrorCode::kFileNotFound:    return "FileNotFound";
        case ErrorCode::kFileParseError:  return "FileParseError";
        case ErrorCode::kIoError:         return "IoError";
        case ErrorCode::kInternalError:   return "InternalError";
    }
    return "Unknown";
}

/**
 * @brief Structured error value carrying a code, message, and origin.
 *
 * Error is a lightweight value type intended to be stored inside
 * Expected<T>, or collected as a non-fatal issue in a report.
 */
class Error final {
public:
    /**
     * @brief Construct an error from a code and message.
     * @param code    Enumerated error code.
     * @param message Human-readable description.
     * @param loc     Source location (auto-filled by the compiler).
     */
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode            code()     const { return _code; }
    [[nodiscard]] const std::string &  message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

    /**
     * @brief Formats the error as "[Code] message (file:line)".
     */
    [[nodiscard]] std::string format() const;

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

template <typename T>
using Expected = std::expected<T, Error>;

using ExpectedVoid = Expected<void>;

/// @brief Builds the failure side of an Expected, stamped with the caller's
///        source location.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

} // namespace mts::core

/**
 * @brief Yields the value of an Expected, or returns its Error from the
 *        enclosing function. GNU statement expression.
 */
#define MTS_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_mts_try = (expr);                                          \
        if (!_mts_try) [[unlikely]]                                        \
            return std::unexpected(std::move(_mts_try.error()));           \
        std::move(*_mts_try);                                              \
    })

/**
 * @brief MTS_TRY for ExpectedVoid.
 */
#define MTS_TRY_VOID(expr)                                                \
    do {                                                                   \
        auto &&_mts_try = (expr);                                          \
        if (!_mts_try) [[unlikely]]                                        \
            return std::unexpected(std::move(_mts_try.error()));           \
    } while (false)

#endif // MTS_CORE_ERROR_HPP
