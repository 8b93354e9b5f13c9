// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace narrator
{

/// @brief Error codes for categorizing failures across the generation and assembly pipeline.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    FormatError,
    SynthesisError,
    PersistenceError,
    DecodeError,
    EncodeError,
    AssemblyError,
    TranscoderError,
    Cancelled,
};

/// @brief Represents an error with a code and descriptive message.
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

/// @brief Returns a stable lowercase name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::IoError: return "io";
        case ErrorCode::ConfigError: return "config";
        case ErrorCode::FormatError: return "format";
        case ErrorCode::SynthesisError: return "synthesis";
        case ErrorCode::PersistenceError: return "persistence";
        case ErrorCode::DecodeError: return "decode";
        case ErrorCode::EncodeError: return "encode";
        case ErrorCode::AssemblyError: return "assembly";
        case ErrorCode::TranscoderError: return "transcoder";
        case ErrorCode::Cancelled: return "cancelled";
    }
    return "unknown";
}

/// @brief Returns true if the error is a cancellation signal rather than a defect.
[[nodiscard]] inline auto isCancellation(const Error& error) -> bool
{
    return error.code == ErrorCode::Cancelled;
}

} // namespace narrator

template <>
struct std::formatter<narrator::Error>: std::formatter<std::string>
{
    auto format(const narrator::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", narrator::errorCodeName(error.code), error.message), ctx);
    }
};
