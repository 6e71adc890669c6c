/*

registry/yaml_loader.hpp
------------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Reading an account registry from YAML:

    sync_binary: /usr/bin/imapmaildir
    accounts:
      - name: work
        enabled: true
        mailboxes: [INBOX]
        imap: { host: imap.example.com, port: ~ }
        maildirAbsPath: /home/u/mail/work
        userName: u@example.com
        passwordCommand: pass show work
        service:
          intervalSec: 120
          extraConfig:
            Service: { Nice: 10 }

`accounts` may also be a mapping from account name to account.

*/

#pragma once

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

#include <syncgen/account/types.hpp>
#include <syncgen/artifact/unit_sections.hpp>
#include <syncgen/detail/error_detail.hpp>
#include <syncgen/detail/log.hpp>
#include <syncgen/detail/result.hpp>
#include <syncgen/registry/registry.hpp>

namespace syncgen
{
namespace detail
{

/// Raised inside the loader only; parse_registry() turns it into a result.
class registry_format_error : public std::runtime_error
{
public:
    registry_format_error(std::string path, const YAML::Node& node, const std::string& message)
        : std::runtime_error(message), path_(std::move(path)), line_(node.Mark().is_null() ? 0 : node.Mark().line + 1)
    {
    }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] int line() const noexcept { return line_; }

private:
    std::string path_;
    int line_;
};

class yaml_account_reader
{
public:
    registry read_document(const YAML::Node& root) const
    {
        if (!root || root.IsNull())
            return registry{};
        if (!root.IsMap())
            throw registry_format_error("", root, "registry root must be a mapping");
        expect_keys(root, "", {"sync_binary", "accounts"});

        registry reg;
        if (auto binary = read_optional_string(root, "sync_binary", ""))
            reg.sync_binary = std::move(*binary);

        const YAML::Node accounts = root["accounts"];
        if (!accounts || accounts.IsNull())
            return reg;

        if (accounts.IsSequence())
        {
            for (std::size_t i = 0; i < accounts.size(); ++i)
            {
                const std::string path = "accounts[" + std::to_string(i) + "]";
                reg.accounts.push_back(read_account(accounts[i], path, std::nullopt));
            }
        }
        else if (accounts.IsMap())
        {
            for (const auto& kv : accounts)
            {
                const std::string name = scalar_text(kv.first, "accounts");
                reg.accounts.push_back(read_account(kv.second, "accounts." + name, name));
            }
        }
        else
            throw registry_format_error("accounts", accounts, "accounts must be a sequence or a mapping");

        return reg;
    }

private:
    account read_account(const YAML::Node& node, const std::string& path, const std::optional<std::string>& key_name) const
    {
        if (!node.IsMap())
            throw registry_format_error(path, node, "account must be a mapping");
        expect_keys(node, path, {"name", "enabled", "mailboxes", "imap", "maildirAbsPath", "userName",
            "passwordCommand", "service"});

        account acc;
        auto name = read_optional_string(node, "name", path);
        if (key_name && name && *name != *key_name)
            throw registry_format_error(path + ".name", node["name"], "name differs from the account key");
        acc.name = key_name ? *key_name : name.value_or(std::string{});

        acc.enabled = read_optional_bool(node, "enabled", path).value_or(false);
        acc.mailboxes = read_string_list(node, "mailboxes", path);
        acc.maildir_abs_path = read_optional_string(node, "maildirAbsPath", path).value_or(std::string{});
        acc.user_name = read_optional_string(node, "userName", path).value_or(std::string{});

        const YAML::Node imap = node["imap"];
        if (imap && !imap.IsNull())
        {
            const std::string imap_path = path + ".imap";
            if (!imap.IsMap())
                throw registry_format_error(imap_path, imap, "imap must be a mapping");
            expect_keys(imap, imap_path, {"host", "port"});
            acc.imap.host = read_optional_string(imap, "host", imap_path).value_or(std::string{});
            acc.imap.port = read_optional_int<int>(imap, "port", imap_path);
        }

        const YAML::Node password = node["passwordCommand"];
        if (password && !password.IsNull())
        {
            const std::string password_path = path + ".passwordCommand";
            if (password.IsScalar())
                acc.password_cmd = password_command{scalar_text(password, password_path)};
            else if (password.IsSequence())
                acc.password_cmd = password_command{read_string_list(node, "passwordCommand", path)};
            else
                throw registry_format_error(password_path, password, "passwordCommand must be a string or a sequence");
        }

        const YAML::Node service = node["service"];
        if (service && !service.IsNull())
        {
            const std::string service_path = path + ".service";
            if (!service.IsMap())
                throw registry_format_error(service_path, service, "service must be a mapping");
            expect_keys(service, service_path, {"name", "intervalSec", "extraConfig"});
            acc.service.name = read_optional_string(service, "name", service_path);
            if (auto interval = read_optional_int<std::int64_t>(service, "intervalSec", service_path))
                acc.service.interval_sec = *interval;
            acc.service.extra_config = read_extra_config(service["extraConfig"], service_path + ".extraConfig");
        }

        return acc;
    }

    unit_sections read_extra_config(const YAML::Node& node, const std::string& path) const
    {
        unit_sections sections;
        if (!node || node.IsNull())
            return sections;
        if (!node.IsMap())
            throw registry_format_error(path, node, "extraConfig must be a mapping of sections");

        for (const auto& section_kv : node)
        {
            const std::string section_name = scalar_text(section_kv.first, path);
            const std::string section_path = path + "." + section_name;
            const YAML::Node& section = section_kv.second;
            if (!section.IsMap())
                throw registry_format_error(section_path, section, "extraConfig section must be a mapping");

            auto& target = sections[section_name];
            for (const auto& kv : section)
            {
                const std::string key = scalar_text(kv.first, section_path);
                target[key] = read_unit_value(kv.second, section_path + "." + key);
            }
        }
        return sections;
    }

    unit_value read_unit_value(const YAML::Node& node, const std::string& path) const
    {
        if (node.IsSequence())
        {
            std::vector<std::string> items;
            items.reserve(node.size());
            for (std::size_t i = 0; i < node.size(); ++i)
                items.push_back(scalar_text(node[i], path + "[" + std::to_string(i) + "]"));
            return unit_value{std::move(items)};
        }

        const std::string text = scalar_text(node, path);
        // Quoted scalars stay strings
        if (node.Tag() == "!")
            return unit_value{text};
        if (text == "true")
            return unit_value{true};
        if (text == "false")
            return unit_value{false};

        std::int64_t number = 0;
        const auto res = std::from_chars(text.data(), text.data() + text.size(), number);
        // Only canonical integers; `0100` or `-0` keep their spelling
        if (res.ec == std::errc{} && res.ptr == text.data() + text.size() && std::to_string(number) == text)
            return unit_value{number};
        return unit_value{text};
    }

    static void expect_keys(const YAML::Node& node, const std::string& path,
        std::initializer_list<std::string_view> allowed)
    {
        for (const auto& kv : node)
        {
            const std::string key = scalar_text(kv.first, path);
            bool known = false;
            for (auto candidate : allowed)
            {
                if (candidate == key)
                {
                    known = true;
                    break;
                }
            }
            if (!known)
                throw registry_format_error(join(path, key), kv.first, "unknown key '" + key + "'");
        }
    }

    static std::string scalar_text(const YAML::Node& node, const std::string& path)
    {
        if (!node.IsScalar())
            throw registry_format_error(path, node, "expected a scalar");
        return node.Scalar();
    }

    static std::optional<std::string> read_optional_string(const YAML::Node& node, std::string_view key,
        const std::string& path)
    {
        const YAML::Node value = node[std::string(key)];
        if (!value || value.IsNull())
            return std::nullopt;
        return scalar_text(value, join(path, key));
    }

    static std::optional<bool> read_optional_bool(const YAML::Node& node, std::string_view key, const std::string& path)
    {
        const YAML::Node value = node[std::string(key)];
        if (!value || value.IsNull())
            return std::nullopt;
        const std::string text = scalar_text(value, join(path, key));
        if (text == "true")
            return true;
        if (text == "false")
            return false;
        throw registry_format_error(join(path, key), value, "expected true or false");
    }

    template<typename Int>
    static std::optional<Int> read_optional_int(const YAML::Node& node, std::string_view key, const std::string& path)
    {
        const YAML::Node value = node[std::string(key)];
        if (!value || value.IsNull())
            return std::nullopt;
        const std::string text = scalar_text(value, join(path, key));
        Int number{};
        const auto res = std::from_chars(text.data(), text.data() + text.size(), number);
        if (res.ec != std::errc{} || res.ptr != text.data() + text.size())
            throw registry_format_error(join(path, key), value, "expected an integer, got '" + text + "'");
        return number;
    }

    /// A bare scalar is accepted as a one element list.
    static std::vector<std::string> read_string_list(const YAML::Node& node, std::string_view key,
        const std::string& path)
    {
        const YAML::Node value = node[std::string(key)];
        const std::string value_path = join(path, key);
        std::vector<std::string> out;
        if (!value || value.IsNull())
            return out;
        if (value.IsScalar())
        {
            out.push_back(value.Scalar());
            return out;
        }
        if (!value.IsSequence())
            throw registry_format_error(value_path, value, "expected a string or a sequence of strings");
        out.reserve(value.size());
        for (std::size_t i = 0; i < value.size(); ++i)
            out.push_back(scalar_text(value[i], value_path + "[" + std::to_string(i) + "]"));
        return out;
    }

    static std::string join(const std::string& path, std::string_view key)
    {
        if (path.empty())
            return std::string(key);
        return path + "." + std::string(key);
    }
};

} // namespace detail

/**
 * Parsing a registry document.
 *
 * @param text YAML text.
 * @return     Registry, or errc::registry_parse_error with `path` and `line` details.
 */
[[nodiscard]] inline result<registry> parse_registry(const std::string& text)
{
    try
    {
        const YAML::Node root = YAML::Load(text);
        return ok(detail::yaml_account_reader{}.read_document(root));
    }
    catch (const detail::registry_format_error& exc)
    {
        detail::error_detail detail;
        detail.add("path", exc.path());
        detail.add_int("line", exc.line());
        return fail<registry>(errc::registry_parse_error, exc.what(), detail);
    }
    catch (const YAML::Exception& exc)
    {
        detail::error_detail detail;
        if (!exc.mark.is_null())
            detail.add_int("line", exc.mark.line + 1);
        return fail<registry>(errc::registry_parse_error, exc.msg, detail);
    }
}

[[nodiscard]] inline result<registry> load_registry(const std::filesystem::path& file)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec))
    {
        detail::error_detail detail;
        detail.add("file", file.string());
        auto info = make_error(errc::io_error, "Registry file is not readable.", detail.str(),
            ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory));
        return fail<registry>(std::move(info));
    }

    try
    {
        SYNCGEN_DEBUG("loading registry " + file.string());
        const YAML::Node root = YAML::LoadFile(file.string());
        return ok(detail::yaml_account_reader{}.read_document(root));
    }
    catch (const YAML::BadFile& exc)
    {
        detail::error_detail detail;
        detail.add("file", file.string());
        return fail<registry>(errc::io_error, exc.msg, detail);
    }
    catch (const detail::registry_format_error& exc)
    {
        detail::error_detail detail;
        detail.add("file", file.string());
        detail.add("path", exc.path());
        detail.add_int("line", exc.line());
        return fail<registry>(errc::registry_parse_error, exc.what(), detail);
    }
    catch (const YAML::Exception& exc)
    {
        detail::error_detail detail;
        detail.add("file", file.string());
        if (!exc.mark.is_null())
            detail.add_int("line", exc.mark.line + 1);
        return fail<registry>(errc::registry_parse_error, exc.msg, detail);
    }
}

} // namespace syncgen
