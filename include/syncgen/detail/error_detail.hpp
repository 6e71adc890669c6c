/*

error_detail.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Header-only helper to build structured error_info::detail strings.

Each entry is formatted as key=value\n to ease parsing by callers that present
errors to the end user.

*/

#pragma once

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>

namespace syncgen::detail
{

class error_detail
{
public:
    error_detail() = default;

    error_detail& add(std::string_view key, std::string_view value)
    {
        append_key(key);
        out_.append(value.data(), value.size());
        out_.push_back('\n');
        return *this;
    }

    error_detail& add_int(std::string_view key, std::int64_t v)
    {
        append_key(key);
        char buffer[32]{};
        const auto res = std::to_chars(std::begin(buffer), std::end(buffer), v);
        if (res.ec == std::errc{})
            out_.append(buffer, static_cast<std::size_t>(res.ptr - buffer));
        else
            out_.append("0");
        out_.push_back('\n');
        return *this;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return out_.empty();
    }

    [[nodiscard]] std::string str() const
    {
        return out_;
    }

private:
    std::string out_;

    void append_key(std::string_view key)
    {
        out_.append(key.data(), key.size());
        out_.push_back('=');
    }
};

/// Finds the value of `key` in a key=value\n detail string.
[[nodiscard]] inline std::string_view find_detail(std::string_view detail, std::string_view key) noexcept
{
    while (!detail.empty())
    {
        const auto eol = detail.find('\n');
        const auto line = detail.substr(0, eol);
        const auto eq = line.find('=');
        if (eq != std::string_view::npos && line.substr(0, eq) == key)
            return line.substr(eq + 1);
        if (eol == std::string_view::npos)
            break;
        detail.remove_prefix(eol + 1);
    }
    return {};
}

} // namespace syncgen::detail
