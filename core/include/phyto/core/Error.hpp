/**
 * @file Error.hpp
 * @brief Error codes, the Error value and the Expected<T> result type.
 *
 * Every fallible operation of the stack returns Expected<T>; the Error it
 * carries records a code, a message and where it was raised. Codes fall
 * into categories so batch drivers can decide what is fatal and what only
 * drops a datapoint.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PHYTO_CORE_ERROR_HPP
    #define PHYTO_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>
    #include <utility>

namespace phyto::core {

/**
 * @brief Error code enumeration.
 */
enum class ErrorCode : u16 {
    kNone = 0,

    kInvalidArgument,
    kNotFitted,

    kShapeMismatch,
    kChannelCountMismatch,

    kEmptyInput,
    kDegenerateSignal,
    kDomainError,

    kFileNotFound,
    kFileParseError,
    kIoError,

    kInternalError
};

/**
 * @brief Coarse classification used to decide whether a failure aborts a
 *        whole batch or only the offending datapoint.
 */
enum class ErrorCategory : u8 {
    kConfiguration,
    kShape,
    kDegenerate,
    kIo,
    kInternal
};

/**
 * @brief Returns a short label for the given error code.
 */
[[nodiscard]] constexpr std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::kNone:                 return "None";
        case ErrorCode::kInvalidArgument:      return "InvalidArgument";
        case ErrorCode::kNotFitted:            return "NotFitted";
        case ErrorCode::kShapeMismatch:        return "ShapeMismatch";
        case ErrorCode::kChannelCountMismatch: return "ChannelCountMismatch";
        case ErrorCode::kEmptyInput:           return "EmptyInput";
        case ErrorCode::kDegenerateSignal:     return "DegenerateSignal";
        case ErrorCode::kDomainError:          return "DomainError";
        case ErrorCode::kFileNotFound:         return "FileNotFound";
        case ErrorCode::kFileParseError:       return "FileParseError";
        case ErrorCode::kIoError:              return "IoError";
        case ErrorCode::kInternalError:        return "InternalError";
    }
    return "Unknown";
}

/**
 * @brief Maps an error code onto its category.
 */
[[nodiscard]] constexpr ErrorCategory errorCategory(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kNotFitted:
            return ErrorCategory::kConfiguration;
        case ErrorCode::kShapeMismatch:
        case ErrorCode::kChannelCountMismatch:
            return ErrorCategory::kShape;
        case ErrorCode::kEmptyInput:
        case ErrorCode::kDegenerateSignal:
        case ErrorCode::kDomainError:
            return ErrorCategory::kDegenerate;
        case ErrorCode::kFileNotFound:
        case ErrorCode::kFileParseError:
        case ErrorCode::kIoError:
            return ErrorCategory::kIo;
        case ErrorCode::kNone:
        case ErrorCode::kInternalError:
            break;
    }
    return ErrorCategory::kInternal;
}

/**
 * @brief Structured error value carrying a code, message, and origin.
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

    [[nodiscard]] ErrorCode            code()     const noexcept { return _code; }
    [[nodiscard]] ErrorCategory        category() const noexcept { return errorCategory(_code); }
    [[nodiscard]] const std::string &  message()  const noexcept { return _message; }
    [[nodiscard]] std::source_location location() const noexcept { return _location; }

    /**
     * @brief Formats the error as "[Code] message (file:line)".
     */
    [[nodiscard]] std::string format() const;

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

/// @brief Convenience alias for std::unexpected<Error>.
using Unexpected = std::unexpected<Error>;

/// @brief Factory function to create an unexpected error.
/// @param code Error code.
/// @param message Human-readable description.
/// @param loc Source location (auto-filled).
/// @return std::unexpected<Error>.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

template <typename T>
using Expected = std::expected<T, Error>;

using ExpectedVoid = Expected<void>;

} // namespace phyto::core

/**
 * @brief Unwraps an Expected expression or returns its error from the
 *        enclosing function.
 *
 * GNU statement expression: usable as an initializer,
 * e.g. `const auto rows = PHYTO_TRY(loadReadings(path));`.
 */
#define PHYTO_TRY(expr)                                                   \
    ({                                                                     \
        auto &&_phyto_result = (expr);                                     \
        if (!_phyto_result.has_value()) [[unlikely]]                       \
            return std::unexpected(std::move(_phyto_result.error()));       \
        std::move(_phyto_result.value());                                  \
    })

/**
 * @brief Statement form of PHYTO_TRY for Expected<void>.
 */
#define PHYTO_TRY_VOID(expr)                                              \
    do {                                                                    \
        auto &&_phyto_result = (expr);                                     \
        if (!_phyto_result.has_value()) [[unlikely]]                       \
            return std::unexpected(std::move(_phyto_result.error()));       \
    } while (false)

#endif // PHYTO_CORE_ERROR_HPP
