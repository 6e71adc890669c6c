/*

compiler.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Registry to artifact pipeline: filter, normalize, compile, aggregate.

*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <syncgen/account/defaults.hpp>
#include <syncgen/account/types.hpp>
#include <syncgen/artifact/config_file.hpp>
#include <syncgen/artifact/service.hpp>
#include <syncgen/artifact/timer.hpp>
#include <syncgen/detail/error_detail.hpp>
#include <syncgen/detail/log.hpp>
#include <syncgen/detail/result.hpp>
#include <syncgen/options.hpp>

namespace syncgen
{

[[nodiscard]] inline const std::string& artifact_key(const service_descriptor& svc) noexcept { return svc.key; }
[[nodiscard]] inline const std::string& artifact_key(const timer_descriptor& timer) noexcept { return timer.key; }
[[nodiscard]] inline const std::string& artifact_key(const config_file_descriptor& cfg) noexcept { return cfg.path; }

[[nodiscard]] constexpr std::string_view artifact_kind(const service_descriptor*) noexcept { return "service"; }
[[nodiscard]] constexpr std::string_view artifact_kind(const timer_descriptor*) noexcept { return "timer"; }
[[nodiscard]] constexpr std::string_view artifact_kind(const config_file_descriptor*) noexcept { return "config_file"; }

/**
 * Insertion ordered collection of one artifact kind, unique by key.
 */
template<class Descriptor>
class keyed_collection
{
public:
    using value_type = Descriptor;
    using const_iterator = typename std::vector<Descriptor>::const_iterator;

    /// Fails with errc::duplicate_artifact_key instead of replacing an entry.
    [[nodiscard]] result<void> insert(Descriptor descriptor)
    {
        const std::string& key = artifact_key(descriptor);
        auto it = index_.find(key);
        if (it != index_.end())
        {
            const Descriptor& existing = items_[it->second];
            const std::string_view kind = artifact_kind(static_cast<const Descriptor*>(nullptr));

            detail::error_detail detail;
            detail.add("kind", kind);
            detail.add("key", key);
            detail.add("account", existing.account);
            detail.add("conflicting_account", descriptor.account);

            std::string message = fmt::format("Accounts '{}' and '{}' both produce {} '{}'.",
                existing.account, descriptor.account, kind, key);
            SYNCGEN_ERROR(message);
            return fail(errc::duplicate_artifact_key, std::move(message), detail);
        }
        index_.emplace(key, items_.size());
        items_.push_back(std::move(descriptor));
        return ok();
    }

    [[nodiscard]] const Descriptor* find(std::string_view key) const noexcept
    {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &items_[it->second];
    }

    [[nodiscard]] bool contains(std::string_view key) const noexcept { return find(key) != nullptr; }
    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
    [[nodiscard]] const_iterator begin() const noexcept { return items_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return items_.end(); }

private:
    std::vector<Descriptor> items_;
    std::map<std::string, std::size_t, std::less<>> index_;
};

/// The three output collections of a compilation run.
struct artifact_set
{
    keyed_collection<service_descriptor> services;
    keyed_collection<timer_descriptor> timers;
    keyed_collection<config_file_descriptor> config_files;

    [[nodiscard]] bool empty() const noexcept
    {
        return services.empty() && timers.empty() && config_files.empty();
    }
};

/// Everything one account contributes.
struct account_artifacts
{
    service_descriptor service;
    timer_descriptor timer;
    config_file_descriptor config_file;
};

[[nodiscard]] inline account_artifacts compile_account(const normalized_account& acc, const compile_options& opts)
{
    SYNCGEN_DEBUG(fmt::format("compiling account {} as {}", acc.name, acc.service_name));
    return account_artifacts{
        compile_service(acc, opts),
        compile_timer(acc),
        compile_config_file(acc, opts)
    };
}

/**
 * Normalizing the enabled accounts of a registry.
 *
 * Names must be unique over the whole registry, disabled entries included.
 * The first invalid account aborts the run.
 */
[[nodiscard]] inline result<std::vector<normalized_account>> normalize_registry(const std::vector<account>& accounts)
{
    std::map<std::string, std::size_t, std::less<>> seen;
    for (std::size_t i = 0; i < accounts.size(); ++i)
    {
        const auto& name = accounts[i].name;
        auto [it, inserted] = seen.emplace(name, i);
        if (!inserted && !name.empty())
        {
            detail::error_detail detail;
            detail.add("account", name);
            detail.add("field", "name");
            detail.add_int("index", static_cast<std::int64_t>(i));
            detail.add_int("first_index", static_cast<std::int64_t>(it->second));
            return fail<std::vector<normalized_account>>(errc::invalid_account_name,
                "Account name '" + name + "' is used more than once.", detail);
        }
    }

    std::vector<normalized_account> out;
    for (const auto& acc : accounts)
    {
        if (!acc.enabled)
        {
            SYNCGEN_DEBUG(fmt::format("skipping disabled account {}", acc.name));
            continue;
        }
        auto normalized = SYNCGEN_TRY(normalize(acc));
        out.push_back(std::move(normalized));
    }
    return ok(std::move(out));
}

/// Merging per-account artifacts by kind; all or nothing.
[[nodiscard]] inline result<artifact_set> aggregate(std::vector<account_artifacts> compiled)
{
    artifact_set set;
    for (auto& artifacts : compiled)
        SYNCGEN_TRY_VOID(set.services.insert(std::move(artifacts.service)));
    for (auto& artifacts : compiled)
        SYNCGEN_TRY_VOID(set.timers.insert(std::move(artifacts.timer)));
    for (auto& artifacts : compiled)
        SYNCGEN_TRY_VOID(set.config_files.insert(std::move(artifacts.config_file)));
    return ok(std::move(set));
}

/**
 * Full pipeline from registry entries to the output collections.
 *
 * Pure: no I/O, and the same input always yields the same collections.
 */
[[nodiscard]] inline result<artifact_set> compile_registry(const std::vector<account>& accounts,
    const compile_options& opts = compile_options::defaults())
{
    auto normalized = SYNCGEN_TRY(normalize_registry(accounts));

    std::vector<account_artifacts> compiled;
    compiled.reserve(normalized.size());
    for (const auto& acc : normalized)
        compiled.push_back(compile_account(acc, opts));

    auto set = SYNCGEN_TRY(aggregate(std::move(compiled)));
    SYNCGEN_INFO(fmt::format("compiled {} of {} accounts", set.services.size(), accounts.size()));
    return ok(std::move(set));
}

} // namespace syncgen
