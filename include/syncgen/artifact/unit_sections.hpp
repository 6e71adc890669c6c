/*

artifact/unit_sections.hpp
--------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Section/key/value model of a systemd unit and the two-layer merge used to put
computed keys on top of user supplied ones.

*/

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include <syncgen/detail/log.hpp>

namespace syncgen
{

/// A list renders as one `Key=value` line per element.
using unit_value = std::variant<std::string, std::int64_t, bool, std::vector<std::string>>;

using unit_section = std::map<std::string, unit_value, std::less<>>;

using unit_sections = std::map<std::string, unit_section, std::less<>>;

/**
 * Merging `overlay` on top of `base`.
 *
 * Sections present in both are merged key by key and the overlay value wins.
 * A shadowed base key is reported as a warning with the given context.
 */
[[nodiscard]] inline unit_sections merge_sections(const unit_sections& base, const unit_sections& overlay,
    std::string_view context = {})
{
    unit_sections merged = base;
    for (const auto& [section_name, section] : overlay)
    {
        auto& target = merged[section_name];
        for (const auto& [key, value] : section)
        {
            auto it = target.find(key);
            if (it != target.end())
            {
                if (it->second != value)
                    SYNCGEN_WARN(fmt::format("{}: extraConfig {}.{} is overridden by the computed value",
                        context, section_name, key));
                it->second = value;
            }
            else
                target.emplace(key, value);
        }
    }
    return merged;
}

/// Looking up a key; nullptr when the section or the key is missing.
[[nodiscard]] inline const unit_value* find_value(const unit_sections& sections,
    std::string_view section, std::string_view key) noexcept
{
    auto sit = sections.find(section);
    if (sit == sections.end())
        return nullptr;
    auto kit = sit->second.find(key);
    if (kit == sit->second.end())
        return nullptr;
    return &kit->second;
}

} // namespace syncgen
