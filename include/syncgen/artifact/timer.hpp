/*

artifact/timer.hpp
------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <syncgen/account/types.hpp>
#include <syncgen/artifact/unit_sections.hpp>
#include <syncgen/codec/unit_file.hpp>

namespace syncgen
{

/**
 * Recurring trigger of one sync service.
 *
 * Fires once right after activation, then `on_unit_inactive_sec` after the
 * previous run of the service finished.
 */
struct timer_descriptor
{
    std::string key;
    std::string account;
    std::string description;
    std::int64_t on_startup_sec = 0;
    std::int64_t on_unit_inactive_sec = 0;
    std::vector<std::string> wanted_by{"timers.target"};

    [[nodiscard]] unit_sections sections() const
    {
        unit_sections out;
        out["Unit"]["Description"] = unit_value{unit_file_encoder::escape_specifiers(description)};
        out["Timer"]["OnStartupSec"] = unit_value{on_startup_sec};
        out["Timer"]["OnUnitInactiveSec"] = unit_value{on_unit_inactive_sec};
        out["Install"]["WantedBy"] = unit_value{wanted_by};
        return out;
    }
};

[[nodiscard]] inline timer_descriptor compile_timer(const normalized_account& acc)
{
    timer_descriptor timer;
    timer.key = acc.service_name;
    timer.account = acc.name;
    timer.description = "timer for " + acc.service_name;
    timer.on_startup_sec = 0;
    timer.on_unit_inactive_sec = acc.interval_sec;
    return timer;
}

} // namespace syncgen
