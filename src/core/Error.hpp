// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace asciiart
{

/// @brief Error codes for categorizing failures across the conversion pipeline.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    FileNotFound,
    UnsupportedFormat,
    InvalidDimensions,
    DecodeFailed,
    IoError,
    UnknownMode,
    ConfigError,
};

/// @brief Returns a short name for an error code, used in debug logging.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorCode::InvalidDimensions: return "InvalidDimensions";
        case ErrorCode::DecodeFailed: return "DecodeFailed";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::UnknownMode: return "UnknownMode";
        case ErrorCode::ConfigError: return "ConfigError";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and a human-readable message.
///
/// The message is complete on its own and is what the user sees.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace asciiart

template <>
struct std::formatter<asciiart::Error>: std::formatter<std::string>
{
    auto format(const asciiart::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", asciiart::errorCodeName(error.code), error.message), ctx);
    }
};
