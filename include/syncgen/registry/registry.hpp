/*

registry/registry.hpp
---------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <syncgen/account/types.hpp>
#include <syncgen/options.hpp>

namespace syncgen
{

/**
 * Snapshot of the account registry handed over by the configuration system.
 */
struct registry
{
    std::optional<std::string> sync_binary;
    std::vector<account> accounts;

    /// Registry settings, with an explicit binary taking precedence.
    [[nodiscard]] compile_options options(const std::optional<std::string>& binary_override = std::nullopt) const
    {
        compile_options opts = compile_options::defaults();
        if (binary_override)
            opts.sync_binary = *binary_override;
        else if (sync_binary)
            opts.sync_binary = *sync_binary;
        return opts;
    }
};

} // namespace syncgen
