#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace parcel {

enum class ErrorKind : std::uint8_t {
    /// Creating or writing the destination file failed.
    IoFailure,
    /// Encoding failed: schema/column mismatch, unavailable codec, writer error.
    WriteFailure,
    /// Reflection or registry lookup failed for one attribute value.
    SerializationFailure,
};

[[nodiscard]] auto to_string(ErrorKind kind) noexcept -> std::string_view;

/// Error with a category and a human-readable message.
struct Error {
    ErrorKind kind = ErrorKind::WriteFailure;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

/// Result type for fallible engine operations.
template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] inline auto io_failure(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = ErrorKind::IoFailure, .message = std::move(message)});
}

[[nodiscard]] inline auto write_failure(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = ErrorKind::WriteFailure, .message = std::move(message)});
}

[[nodiscard]] inline auto serialization_failure(std::string message) -> std::unexpected<Error> {
    return std::unexpected(
        Error{.kind = ErrorKind::SerializationFailure, .message = std::move(message)});
}

}  // namespace parcel

template <>
struct fmt::formatter<parcel::Error> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const parcel::Error& error, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(error.format(), ctx);
    }
};
