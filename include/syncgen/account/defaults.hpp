/*

account/defaults.hpp
--------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Defaulting and validation of raw accounts.

*/

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <syncgen/account/types.hpp>
#include <syncgen/detail/error_detail.hpp>
#include <syncgen/detail/result.hpp>
#include <syncgen/detail/sanitize.hpp>

namespace syncgen
{

inline constexpr int default_imap_port = 993;
inline constexpr std::int64_t default_interval_sec = 300;
inline constexpr std::string_view service_name_prefix = "imapmaildir-sync-";

[[nodiscard]] inline std::string default_service_name(std::string_view account_name)
{
    return std::string(service_name_prefix) + std::string(account_name);
}

[[nodiscard]] inline int apply_port_default(const std::optional<int>& port) noexcept
{
    return port.value_or(default_imap_port);
}

/// Both input shapes end up as program plus arguments.
[[nodiscard]] inline std::vector<std::string> to_command_list(const password_command& cmd)
{
    return std::visit([](const auto& value) -> std::vector<std::string>
    {
        using value_t = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<value_t, std::string>)
            return {value};
        else
            return value;
    }, cmd);
}

namespace detail
{

[[nodiscard]] inline error_detail account_detail(std::string_view account, std::string_view field)
{
    error_detail detail;
    detail.add("account", account);
    detail.add("field", field);
    return detail;
}

[[nodiscard]] inline result<void> require_non_empty(std::string_view value, std::string_view account,
    std::string_view field)
{
    if (!value.empty())
        return ok();
    return fail(errc::missing_required_field, "Missing required field " + std::string(field) + ".",
        account_detail(account, field));
}

[[nodiscard]] inline result<void> check_extra_config(const unit_sections& extra, std::string_view account)
{
    for (const auto& [section_name, section] : extra)
    {
        for (const auto& [key, value] : section)
        {
            const std::string field = "service.extraConfig." + section_name + "." + key;
            if (section_name.empty() || key.empty() || contains_crlf_or_nul(section_name) || contains_crlf_or_nul(key)
                || section_name.find_first_of("[]") != std::string::npos || key.find('=') != std::string::npos)
            {
                return fail(errc::invalid_field_value, "Invalid extraConfig section or key name.",
                    account_detail(account, field));
            }
            if (const auto* text = std::get_if<std::string>(&value))
                SYNCGEN_TRY_VOID(ensure_unit_value(*text, account, field));
            else if (const auto* list = std::get_if<std::vector<std::string>>(&value))
                for (const auto& item : *list)
                    SYNCGEN_TRY_VOID(ensure_unit_value(item, account, field));
        }
    }
    return ok();
}

} // namespace detail

/**
 * Resolving defaults and validating a single account.
 *
 * Duplicate names cannot be seen from one account; normalize_registry() checks them.
 */
[[nodiscard]] inline result<normalized_account> normalize(const account& acc)
{
    using detail::account_detail;

    if (acc.name.empty())
        return fail<normalized_account>(errc::invalid_account_name, "Account name must not be empty.",
            account_detail(acc.name, "name"));
    if (!detail::is_safe_account_name(acc.name))
        return fail<normalized_account>(errc::invalid_account_name,
            "Account name must not contain '/', whitespace or control characters, nor end in a backslash.",
            account_detail(acc.name, "name"));

    SYNCGEN_TRY_VOID(detail::require_non_empty(acc.imap.host, acc.name, "imap.host"));
    SYNCGEN_TRY_VOID(detail::require_non_empty(acc.maildir_abs_path, acc.name, "maildirAbsPath"));

    if (!acc.password_cmd)
        return fail<normalized_account>(errc::missing_credential_source,
            "passwordCommand must be set to obtain the account password.",
            account_detail(acc.name, "passwordCommand"));

    if (acc.service.interval_sec <= 0)
    {
        auto detail = account_detail(acc.name, "service.intervalSec");
        detail.add_int("value", acc.service.interval_sec);
        return fail<normalized_account>(errc::invalid_interval, "intervalSec must be a positive integer.", detail);
    }

    const int port = apply_port_default(acc.imap.port);
    if (port < 1 || port > 65535)
    {
        auto detail = account_detail(acc.name, "imap.port");
        detail.add_int("value", port);
        return fail<normalized_account>(errc::invalid_port, "IMAP port must be within 1..65535.", detail);
    }

    std::string service_name = acc.service.name.value_or(default_service_name(acc.name));
    if (!detail::is_valid_unit_name(service_name))
    {
        auto detail = account_detail(acc.name, "service.name");
        detail.add("value", service_name);
        return fail<normalized_account>(errc::invalid_service_name,
            "Service name contains characters not allowed in a unit name.", detail);
    }

    std::vector<std::string> password_cmd = to_command_list(*acc.password_cmd);
    if (password_cmd.empty() || password_cmd.front().empty())
        return fail<normalized_account>(errc::missing_credential_source,
            "passwordCommand must name a program.", account_detail(acc.name, "passwordCommand"));

    SYNCGEN_TRY_VOID(detail::ensure_single_line(acc.imap.host, acc.name, "imap.host"));
    SYNCGEN_TRY_VOID(detail::ensure_single_line(acc.maildir_abs_path, acc.name, "maildirAbsPath"));
    SYNCGEN_TRY_VOID(detail::ensure_single_line(acc.user_name, acc.name, "userName"));
    for (const auto& mailbox : acc.mailboxes)
        SYNCGEN_TRY_VOID(detail::ensure_single_line(mailbox, acc.name, "mailboxes"));
    for (const auto& part : password_cmd)
        SYNCGEN_TRY_VOID(detail::ensure_single_line(part, acc.name, "passwordCommand"));
    SYNCGEN_TRY_VOID(detail::check_extra_config(acc.service.extra_config, acc.name));

    normalized_account out;
    out.name = acc.name;
    out.enabled = acc.enabled;
    out.mailboxes = acc.mailboxes;
    out.host = acc.imap.host;
    out.port = port;
    out.maildir_abs_path = acc.maildir_abs_path;
    out.user_name = acc.user_name;
    out.password_cmd = std::move(password_cmd);
    out.service_name = std::move(service_name);
    out.interval_sec = acc.service.interval_sec;
    out.extra_config = acc.service.extra_config;
    return ok(std::move(out));
}

} // namespace syncgen
