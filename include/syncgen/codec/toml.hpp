/*

codec/toml.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>


namespace syncgen
{
namespace toml
{

using scalar = std::variant<std::string, std::int64_t, bool, std::vector<std::string>>;

/**
Insertion ordered TOML table with scalar values and nested tables.
**/
class table
{
public:

    /**
    Setting a value, replacing an existing one under the same key in place.

    @param key   Key of the value.
    @param value Value to store.
    @return      This table.
    **/
    table& set(std::string key, scalar value)
    {
        for (auto& entry : values_)
        {
            if (entry.first == key)
            {
                entry.second = std::move(value);
                return *this;
            }
        }
        values_.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    table& set_table(std::string key, table value)
    {
        for (auto& entry : tables_)
        {
            if (entry.first == key)
            {
                entry.second = std::move(value);
                return *this;
            }
        }
        tables_.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    const scalar* find(std::string_view key) const noexcept
    {
        for (const auto& entry : values_)
            if (entry.first == key)
                return &entry.second;
        return nullptr;
    }

    const table* find_table(std::string_view key) const noexcept
    {
        for (const auto& entry : tables_)
            if (entry.first == key)
                return &entry.second;
        return nullptr;
    }

    const std::vector<std::pair<std::string, scalar>>& values() const noexcept
    {
        return values_;
    }

    const std::vector<std::pair<std::string, table>>& tables() const noexcept
    {
        return tables_;
    }

    bool empty() const noexcept
    {
        return values_.empty() && tables_.empty();
    }

private:

    std::vector<std::pair<std::string, scalar>> values_;

    std::vector<std::pair<std::string, table>> tables_;
};

} // namespace toml


/**
TOML serializer for the subset used by the account configuration files.

Scalar keys of a table are written before its sub-tables, each sub-table gets a
`[dotted.path]` header. Strings are always written as basic strings.
**/
class toml_encoder
{
public:

    toml_encoder() = default;

    toml_encoder(const toml_encoder&) = delete;

    toml_encoder(toml_encoder&&) = delete;

    ~toml_encoder() = default;

    void operator=(const toml_encoder&) = delete;

    void operator=(toml_encoder&&) = delete;

    /**
    Encoding a document.

    @param doc Root table.
    @return    TOML text, terminated by a newline when not empty.
    **/
    std::string encode(const toml::table& doc) const
    {
        std::string out;
        encode_table(doc, std::string{}, out);
        return out;
    }

    /**
    Escaping a string as a TOML basic string, quotes included.

    @param text String to quote.
    @return     Quoted string.
    **/
    static std::string quote(std::string_view text)
    {
        std::string out;
        out.reserve(text.size() + 2);
        out += QUOTE_CHAR;
        for (char ch : text)
        {
            switch (ch)
            {
                case '"':  out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\b': out += "\\b"; break;
                case '\t': out += "\\t"; break;
                case '\n': out += "\\n"; break;
                case '\f': out += "\\f"; break;
                case '\r': out += "\\r"; break;
                default:
                    if (static_cast<unsigned char>(ch) < 0x20 || ch == 0x7f)
                        out += fmt::format("\\u{:04X}", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                    else
                        out += ch;
            }
        }
        out += QUOTE_CHAR;
        return out;
    }

    /**
    Bare keys are written as they are, anything else is quoted.

    @param key Key to write.
    @return    Key as it appears in the document.
    **/
    static std::string encode_key(std::string_view key)
    {
        if (is_bare_key(key))
            return std::string(key);
        return quote(key);
    }

    static bool is_bare_key(std::string_view key) noexcept
    {
        if (key.empty())
            return false;
        for (char ch : key)
        {
            const bool allowed = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')
                || ch == '_' || ch == '-';
            if (!allowed)
                return false;
        }
        return true;
    }

private:

    void encode_table(const toml::table& tbl, const std::string& path, std::string& out) const
    {
        for (const auto& [key, value] : tbl.values())
        {
            out += encode_key(key);
            out += " = ";
            out += encode_scalar(value);
            out += END_OF_LINE;
        }

        for (const auto& [key, sub] : tbl.tables())
        {
            const std::string sub_path = path.empty() ? encode_key(key) : path + "." + encode_key(key);
            if (!out.empty())
                out += END_OF_LINE;
            out += "[" + sub_path + "]";
            out += END_OF_LINE;
            encode_table(sub, sub_path, out);
        }
    }

    static std::string encode_scalar(const toml::scalar& value)
    {
        struct visitor
        {
            std::string operator()(const std::string& text) const
            {
                return quote(text);
            }

            std::string operator()(std::int64_t number) const
            {
                return std::to_string(number);
            }

            std::string operator()(bool flag) const
            {
                return flag ? "true" : "false";
            }

            std::string operator()(const std::vector<std::string>& items) const
            {
                std::string out = "[";
                for (std::size_t i = 0; i < items.size(); ++i)
                {
                    if (i > 0)
                        out += ", ";
                    out += quote(items[i]);
                }
                out += "]";
                return out;
            }
        };
        return std::visit(visitor{}, value);
    }

    static constexpr char QUOTE_CHAR = '"';

    static constexpr char END_OF_LINE = '\n';
};


} // namespace syncgen
