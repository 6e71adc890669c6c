/*

options.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <utility>

namespace syncgen
{

/**
 * Settings shared by every account of a compilation run.
 */
struct compile_options
{
    /// Program started by the generated services
    std::string sync_binary = "imapmaildir";

    /// Where the sync binary looks for `<account>.toml`, relative to the configuration root
    std::string config_subdir = "imapmaildir/accounts";

    static compile_options defaults()
    {
        return compile_options{};
    }

    static compile_options with_binary(std::string binary)
    {
        compile_options opts;
        opts.sync_binary = std::move(binary);
        return opts;
    }
};

} // namespace syncgen
