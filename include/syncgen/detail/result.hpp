/*

result.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Error handling types using std::expected (C++23).
Compilation never throws; every failure is returned via result<T>.

*/

#pragma once

#include <cstdint>
#include <expected>
#include <ostream>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include <syncgen/detail/error_detail.hpp>

namespace syncgen
{

/// Error categories for syncgen operations
enum class errc : std::uint16_t
{
    ok = 0,

    // Account validation (100-199)
    invalid_account_name = 100,
    missing_required_field = 101,
    invalid_interval = 102,
    missing_credential_source = 103,
    invalid_service_name = 104,
    invalid_port = 105,
    invalid_field_value = 106,

    // Aggregation (200-299)
    duplicate_artifact_key = 200,

    // Registry input (300-399)
    registry_parse_error = 300,

    // Emission (400-499)
    io_error = 400,
};

/// Stable identifier of an error code
[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept
{
    switch (code)
    {
        case errc::ok: return "ok";
        case errc::invalid_account_name: return "invalid_account_name";
        case errc::missing_required_field: return "missing_required_field";
        case errc::invalid_interval: return "invalid_interval";
        case errc::missing_credential_source: return "missing_credential_source";
        case errc::invalid_service_name: return "invalid_service_name";
        case errc::invalid_port: return "invalid_port";
        case errc::invalid_field_value: return "invalid_field_value";
        case errc::duplicate_artifact_key: return "duplicate_artifact_key";
        case errc::registry_parse_error: return "registry_parse_error";
        case errc::io_error: return "io_error";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, errc code)
{
    return os << to_string(code);
}

/// Error payload carried by every failed result
struct error_info
{
    errc code = errc::ok;
    std::string message;
    /// key=value lines, see detail::error_detail
    std::string detail;
    std::error_code sys;
    std::source_location where = std::source_location::current();

    [[nodiscard]] bool is(errc c) const noexcept { return code == c; }
};

template<typename T>
using result = std::expected<T, error_info>;

[[nodiscard]] inline error_info make_error(
    errc code,
    std::string message,
    std::string detail = {},
    std::error_code sys = {},
    std::source_location where = std::source_location::current())
{
    return error_info{code, std::move(message), std::move(detail), sys, where};
}

namespace detail
{

[[nodiscard]] inline std::unexpected<error_info> make_unexpected(error_info info)
{
    return std::unexpected<error_info>(std::move(info));
}

} // namespace detail

[[nodiscard]] inline result<void> ok()
{
    return result<void>{};
}

template<typename T>
[[nodiscard]] result<std::decay_t<T>> ok(T&& value)
{
    return result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
[[nodiscard]] result<T> fail(
    errc code,
    std::string message,
    std::string detail_text = {},
    std::source_location where = std::source_location::current())
{
    return ::syncgen::detail::make_unexpected(make_error(code, std::move(message), std::move(detail_text), {}, where));
}

template<typename T = void>
[[nodiscard]] result<T> fail(
    errc code,
    std::string message,
    const detail::error_detail& detail_lines,
    std::source_location where = std::source_location::current())
{
    return ::syncgen::detail::make_unexpected(make_error(code, std::move(message), detail_lines.str(), {}, where));
}

template<typename T = void>
[[nodiscard]] result<T> fail(error_info info)
{
    return ::syncgen::detail::make_unexpected(std::move(info));
}

/// Propagate the error of a result-returning expression, or yield its value.
#define SYNCGEN_TRY(expr) \
    ({ \
        auto&& _syncgen_result = (expr); \
        if (!_syncgen_result) [[unlikely]] \
            return ::syncgen::detail::make_unexpected(std::move(_syncgen_result).error()); \
        std::move(*_syncgen_result); \
    })

#define SYNCGEN_TRY_VOID(expr) \
    do { \
        auto&& _syncgen_result = (expr); \
        if (!_syncgen_result) [[unlikely]] \
            return ::syncgen::detail::make_unexpected(std::move(_syncgen_result).error()); \
    } while (0)

} // namespace syncgen
