/*

codec/unit_file.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <syncgen/artifact/unit_sections.hpp>


namespace syncgen
{


/**
Systemd unit file serializer.

Values are written verbatim so that user supplied specifiers such as `%h` keep
working; computed values are escaped by the caller with `escape_specifiers()`
or `encode_command_line()`.
**/
class unit_file_encoder
{
public:

    unit_file_encoder() = default;

    unit_file_encoder(const unit_file_encoder&) = delete;

    unit_file_encoder(unit_file_encoder&&) = delete;

    ~unit_file_encoder() = default;

    void operator=(const unit_file_encoder&) = delete;

    void operator=(unit_file_encoder&&) = delete;

    /**
    Encoding the sections of a unit.

    Well known sections come first in the order systemd documents them, the
    rest follow by name. Empty sections are skipped.

    @param sections Unit content.
    @return         Unit file text.
    **/
    std::string encode(const unit_sections& sections) const
    {
        std::string out;
        for (std::string_view name : CANONICAL_SECTIONS)
        {
            auto it = sections.find(name);
            if (it != sections.end())
                encode_section(it->first, it->second, out);
        }
        for (const auto& [name, section] : sections)
        {
            if (!is_canonical(name))
                encode_section(name, section, out);
        }
        return out;
    }

    /**
    Doubling `%` so that systemd does not expand specifiers.

    @param text Text to escape.
    @return     Escaped text.
    **/
    static std::string escape_specifiers(std::string_view text)
    {
        std::string out;
        out.reserve(text.size());
        for (char ch : text)
        {
            if (ch == SPECIFIER_CHAR)
                out += SPECIFIER_CHAR;
            out += ch;
        }
        return out;
    }

    /**
    Encoding a program and its arguments as an `ExecStart=` command line.

    Arguments with whitespace, quotes or backslashes are double quoted with C
    style escapes; `%` and `$` are doubled everywhere.

    @param argv Program followed by its arguments.
    @return     Command line.
    **/
    static std::string encode_command_line(const std::vector<std::string>& argv)
    {
        std::string out;
        for (std::size_t i = 0; i < argv.size(); ++i)
        {
            if (i > 0)
                out += ' ';
            out += encode_argument(argv[i]);
        }
        return out;
    }

    static std::string encode_argument(std::string_view arg)
    {
        bool needs_quotes = arg.empty();
        for (char ch : arg)
        {
            if (ch == ' ' || ch == '\t' || ch == '"' || ch == '\'' || ch == '\\' || ch == ';')
            {
                needs_quotes = true;
                break;
            }
        }

        std::string out;
        if (needs_quotes)
            out += '"';
        for (char ch : arg)
        {
            switch (ch)
            {
                case '"':  out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\t': out += "\\t"; break;
                case SPECIFIER_CHAR: out += "%%"; break;
                case VARIABLE_CHAR: out += "$$"; break;
                default: out += ch;
            }
        }
        if (needs_quotes)
            out += '"';
        return out;
    }

private:

    static bool is_canonical(std::string_view name) noexcept
    {
        for (std::string_view canonical : CANONICAL_SECTIONS)
            if (canonical == name)
                return true;
        return false;
    }

    static void encode_section(const std::string& name, const unit_section& section, std::string& out)
    {
        if (section.empty())
            return;
        if (!out.empty())
            out += END_OF_LINE;
        out += "[" + name + "]";
        out += END_OF_LINE;
        for (const auto& [key, value] : section)
            encode_entry(key, value, out);
    }

    static void encode_entry(const std::string& key, const unit_value& value, std::string& out)
    {
        struct visitor
        {
            const std::string& key;
            std::string& out;

            void line(std::string_view text) const
            {
                out += key;
                out += '=';
                out += text;
                out += END_OF_LINE;
            }

            void operator()(const std::string& text) const
            {
                line(text);
            }

            void operator()(std::int64_t number) const
            {
                line(std::to_string(number));
            }

            void operator()(bool flag) const
            {
                line(flag ? "true" : "false");
            }

            void operator()(const std::vector<std::string>& items) const
            {
                for (const auto& item : items)
                    line(item);
            }
        };
        std::visit(visitor{key, out}, value);
    }

    static constexpr std::array<std::string_view, 5> CANONICAL_SECTIONS{"Unit", "Service", "Timer", "Socket", "Install"};

    static constexpr char SPECIFIER_CHAR = '%';

    static constexpr char VARIABLE_CHAR = '$';

    static constexpr char END_OF_LINE = '\n';
};


} // namespace syncgen
