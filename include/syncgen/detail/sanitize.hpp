/*

sanitize.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cctype>
#include <string>
#include <string_view>

#include <syncgen/detail/error_detail.hpp>
#include <syncgen/detail/result.hpp>

namespace syncgen
{
namespace detail
{

inline bool contains_crlf_or_nul(std::string_view value) noexcept
{
    for (char ch : value)
    {
        if (ch == '\r' || ch == '\n' || ch == '\0')
            return true;
    }
    return false;
}

/// Values interpolated into unit and TOML files must stay on one line.
inline result<void> ensure_single_line(std::string_view value, std::string_view account, std::string_view field)
{
    if (!contains_crlf_or_nul(value))
        return ok();

    error_detail detail;
    detail.add("account", account);
    detail.add("field", field);
    return fail(errc::invalid_field_value,
        "Invalid " + std::string(field) + ": CR/LF or NUL not allowed.", detail);
}

/// systemd joins a line ending in a backslash with the next one.
inline bool ends_with_continuation(std::string_view value) noexcept
{
    return !value.empty() && value.back() == '\\';
}

/// Unit file values must additionally not swallow the following line.
inline result<void> ensure_unit_value(std::string_view value, std::string_view account, std::string_view field)
{
    SYNCGEN_TRY_VOID(ensure_single_line(value, account, field));
    if (!ends_with_continuation(value))
        return ok();

    error_detail detail;
    detail.add("account", account);
    detail.add("field", field);
    return fail(errc::invalid_field_value,
        "Invalid " + std::string(field) + ": trailing backslash continues the line.", detail);
}

/// Account names become file names and unit name suffixes.
inline bool is_safe_account_name(std::string_view name) noexcept
{
    if (name.empty() || name == "." || name == ".." || ends_with_continuation(name))
        return false;
    for (char ch : name)
    {
        const auto uch = static_cast<unsigned char>(ch);
        if (ch == '/' || std::isspace(uch) || std::iscntrl(uch))
            return false;
    }
    return true;
}

/// Characters systemd accepts in a unit name, without the type suffix.
inline bool is_valid_unit_name(std::string_view name) noexcept
{
    // 255 including the longest suffix ".service"
    constexpr std::size_t max_length = 255 - 8;
    if (name.empty() || name.size() > max_length || ends_with_continuation(name))
        return false;
    for (char ch : name)
    {
        const auto uch = static_cast<unsigned char>(ch);
        if (std::isalnum(uch))
            continue;
        if (ch == ':' || ch == '_' || ch == '.' || ch == '-' || ch == '@' || ch == '\\')
            continue;
        return false;
    }
    return true;
}

} // namespace detail
} // namespace syncgen
