#pragma once

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <expected>
#include <optional>
#include <string_view>
#include <utility>

namespace parcel::diag {

// ─── Lenient logging wrappers ─────────────────────────────────────────────────
//  Log the failure (or success) of an optional, expected or boolean outcome
//  and hand the value back untouched, so non-fatal conditions can be noted
//  inline without changing control flow.

/// Log an error if `result` failed, then drop it.
template <typename T, typename E>
void hope(const std::expected<T, E>& result) {
    if (!result) {
        spdlog::error("failure: {}", result.error());
    }
}

template <typename T>
void hope(const std::optional<T>& value) {
    if (!value) {
        spdlog::error("empty option");
    }
}

inline void hope(bool ok) {
    if (!ok) {
        spdlog::error("empty option");
    }
}

/// Log an error if `result` failed; return it unchanged.
template <typename T, typename E>
auto complain(std::expected<T, E> result) -> std::expected<T, E> {
    if (!result) {
        spdlog::error("failure: {}", result.error());
    }
    return result;
}

template <typename T>
auto complain(std::optional<T> value) -> std::optional<T> {
    if (!value) {
        spdlog::error("empty option");
    }
    return value;
}

inline auto complain(bool ok) -> bool {
    if (!ok) {
        spdlog::error("empty option");
    }
    return ok;
}

/// Log `msg: <error>` at error level if `result` failed; return it unchanged.
template <typename T, typename E>
auto complain_msg(std::expected<T, E> result, std::string_view msg) -> std::expected<T, E> {
    if (!result) {
        spdlog::error("{}: {}", msg, result.error());
    }
    return result;
}

template <typename T>
auto complain_msg(std::optional<T> value, std::string_view msg) -> std::optional<T> {
    if (!value) {
        spdlog::error("{}", msg);
    }
    return value;
}

inline auto complain_msg(bool ok, std::string_view msg) -> bool {
    if (!ok) {
        spdlog::error("{}", msg);
    }
    return ok;
}

/// As complain_msg, at warning level.
template <typename T, typename E>
auto warn_msg(std::expected<T, E> result, std::string_view msg) -> std::expected<T, E> {
    if (!result) {
        spdlog::warn("{}: {}", msg, result.error());
    }
    return result;
}

template <typename T>
auto warn_msg(std::optional<T> value, std::string_view msg) -> std::optional<T> {
    if (!value) {
        spdlog::warn("{}", msg);
    }
    return value;
}

inline auto warn_msg(bool ok, std::string_view msg) -> bool {
    if (!ok) {
        spdlog::warn("{}", msg);
    }
    return ok;
}

/// Log `msg` at info level if `result` succeeded; return it unchanged.
template <typename T, typename E>
auto relief_msg(std::expected<T, E> result, std::string_view msg) -> std::expected<T, E> {
    if (result) {
        spdlog::info("{}", msg);
    }
    return result;
}

template <typename T>
auto relief_msg(std::optional<T> value, std::string_view msg) -> std::optional<T> {
    if (value) {
        spdlog::info("{}", msg);
    }
    return value;
}

inline auto relief_msg(bool ok, std::string_view msg) -> bool {
    if (ok) {
        spdlog::info("{}", msg);
    }
    return ok;
}

/// Log `msg: <value>` at debug level; return the value.
template <typename T>
auto report_msg(T&& value, std::string_view msg) -> T&& {
    spdlog::debug("{}: {}", msg, value);
    return std::forward<T>(value);
}

}  // namespace parcel::diag
