/*

account/types.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <syncgen/artifact/unit_sections.hpp>

namespace syncgen
{

/// `passwordCommand` as supplied: one command line, or program and arguments.
using password_command = std::variant<std::string, std::vector<std::string>>;

struct imap_endpoint
{
    std::string host;
    /// Unset and null are the same thing here.
    std::optional<int> port;
};

struct service_options
{
    std::optional<std::string> name;
    std::int64_t interval_sec = 300;
    /// Merged underneath the computed unit keys.
    unit_sections extra_config;
};

/**
 * One registry entry, exactly as the configuration system hands it over.
 */
struct account
{
    std::string name;
    bool enabled = false;
    std::vector<std::string> mailboxes;
    imap_endpoint imap;
    std::string maildir_abs_path;
    std::string user_name;
    std::optional<password_command> password_cmd;
    service_options service;
};

/**
 * Account after defaulting; every optional has been resolved.
 */
struct normalized_account
{
    std::string name;
    bool enabled = false;
    std::vector<std::string> mailboxes;
    std::string host;
    int port = 0;
    std::string maildir_abs_path;
    std::string user_name;
    std::vector<std::string> password_cmd;
    std::string service_name;
    std::int64_t interval_sec = 0;
    unit_sections extra_config;
};

} // namespace syncgen
