/*

artifact/service.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <string>
#include <vector>

#include <syncgen/account/types.hpp>
#include <syncgen/artifact/unit_sections.hpp>
#include <syncgen/codec/unit_file.hpp>
#include <syncgen/options.hpp>

namespace syncgen
{

struct service_descriptor
{
    std::string key;
    std::string account;
    std::string description;
    std::vector<std::string> exec_command;
    /// extraConfig with the computed keys layered on top
    unit_sections sections;
};

[[nodiscard]] inline std::string service_description(const std::string& account_name)
{
    return "mail sync via imapmaildir for account " + account_name;
}

/// Keys that compile_service() always sets, independent of extraConfig.
[[nodiscard]] inline unit_sections computed_service_sections(const std::string& description,
    const std::vector<std::string>& exec_command)
{
    unit_sections computed;
    computed["Unit"]["Description"] = unit_value{unit_file_encoder::escape_specifiers(description)};
    computed["Service"]["Type"] = unit_value{std::string("exec")};
    computed["Service"]["ExecStart"] = unit_value{unit_file_encoder::encode_command_line(exec_command)};
    return computed;
}

[[nodiscard]] inline service_descriptor compile_service(const normalized_account& acc, const compile_options& opts)
{
    service_descriptor svc;
    svc.key = acc.service_name;
    svc.account = acc.name;
    svc.description = service_description(acc.name);
    svc.exec_command = {opts.sync_binary, "--account", acc.name};
    svc.sections = merge_sections(acc.extra_config, computed_service_sections(svc.description, svc.exec_command),
        "account " + acc.name);
    return svc;
}

} // namespace syncgen
