/*

artifact/config_file.hpp
------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include <syncgen/account/types.hpp>
#include <syncgen/codec/toml.hpp>
#include <syncgen/options.hpp>

namespace syncgen
{

/// Only plain user/password authentication is understood by the sync binary.
inline constexpr const char* auth_type_plain = "Plain";

struct config_file_descriptor
{
    /// Relative to the configuration root, e.g. `imapmaildir/accounts/work.toml`
    std::string path;
    std::string account;
    toml::table content;
};

[[nodiscard]] inline std::string config_file_path(const std::string& account_name, const compile_options& opts)
{
    std::string path = opts.config_subdir;
    if (!path.empty() && path.back() != '/')
        path += '/';
    return path + account_name + ".toml";
}

[[nodiscard]] inline config_file_descriptor compile_config_file(const normalized_account& acc,
    const compile_options& opts)
{
    toml::table auth;
    auth.set("password_cmd", toml::scalar{acc.password_cmd});
    auth.set("type", toml::scalar{std::string(auth_type_plain)});
    auth.set("user", toml::scalar{acc.user_name});

    config_file_descriptor cfg;
    cfg.path = config_file_path(acc.name, opts);
    cfg.account = acc.name;
    cfg.content.set("host", toml::scalar{acc.host});
    cfg.content.set("mailboxes", toml::scalar{acc.mailboxes});
    cfg.content.set("maildir_base_path", toml::scalar{acc.maildir_abs_path});
    cfg.content.set("port", toml::scalar{static_cast<std::int64_t>(acc.port)});
    cfg.content.set_table("auth", std::move(auth));
    return cfg;
}

} // namespace syncgen
