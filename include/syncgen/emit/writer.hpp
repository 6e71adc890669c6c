/*

emit/writer.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Rendering compiled artifacts to file contents and writing them to disk.

Only the files of the current artifact set are touched. Units and
configuration files of accounts that were removed or disabled since the last
run are left in place, and a stale timer keeps firing until it is deleted and
the user manager reloaded. Each file is replaced atomically, but a run is not:
when a write fails, the files written before it stay replaced.

*/

#pragma once

#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

#include <fmt/format.h>

#include <syncgen/codec/toml.hpp>
#include <syncgen/codec/unit_file.hpp>
#include <syncgen/compiler.hpp>
#include <syncgen/detail/error_detail.hpp>
#include <syncgen/detail/log.hpp>
#include <syncgen/detail/result.hpp>

namespace syncgen
{

/// Which output root a rendered file belongs to.
enum class output_root
{
    unit_dir,
    config_root
};

struct rendered_file
{
    output_root root;
    /// Relative to its root
    std::filesystem::path path;
    std::string content;
};

/**
 * Output locations. Units go to e.g. `~/.config/systemd/user`, account
 * configuration files below e.g. `~/.config`.
 */
struct output_layout
{
    std::filesystem::path unit_dir;
    std::filesystem::path config_root;

    [[nodiscard]] std::filesystem::path resolve(const rendered_file& file) const
    {
        return (file.root == output_root::unit_dir ? unit_dir : config_root) / file.path;
    }

    /// XDG defaults; nullopt when neither XDG_CONFIG_HOME nor HOME is set.
    [[nodiscard]] static std::optional<output_layout> from_environment()
    {
        std::filesystem::path config_home;
        if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0')
            config_home = xdg;
        else if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0')
            config_home = std::filesystem::path(home) / ".config";
        else
            return std::nullopt;
        return output_layout{config_home / "systemd" / "user", config_home};
    }
};

struct write_report
{
    std::size_t written = 0;
    std::size_t unchanged = 0;
};

/**
 * Rendering every artifact: services, then timers, then configuration files,
 * each in insertion order.
 */
[[nodiscard]] inline std::vector<rendered_file> render_artifacts(const artifact_set& set)
{
    unit_file_encoder units;
    toml_encoder configs;

    std::vector<rendered_file> files;
    files.reserve(set.services.size() + set.timers.size() + set.config_files.size());
    for (const auto& svc : set.services)
        files.push_back({output_root::unit_dir, svc.key + ".service", units.encode(svc.sections)});
    for (const auto& timer : set.timers)
        files.push_back({output_root::unit_dir, timer.key + ".timer", units.encode(timer.sections())});
    for (const auto& cfg : set.config_files)
        files.push_back({output_root::config_root, cfg.path, configs.encode(cfg.content)});
    return files;
}

namespace detail
{

[[nodiscard]] inline result<void> io_failure(const std::string& message, const std::filesystem::path& path,
    std::error_code ec)
{
    error_detail detail;
    detail.add("file", path.string());
    if (ec)
        detail.add("reason", ec.message());
    return fail(make_error(errc::io_error, message, detail.str(), ec));
}

[[nodiscard]] inline std::optional<std::string> read_existing(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        return std::nullopt;
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return std::nullopt;
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

/// Writing next to the target, then renaming over it.
[[nodiscard]] inline result<void> replace_file(const std::filesystem::path& target, const std::string& content)
{
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec)
        return io_failure("Cannot create output directory.", target.parent_path(), ec);

    auto tmp = target;
    tmp += fmt::format(".tmp.{}", static_cast<long>(::getpid()));
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
            return io_failure("Cannot open temporary file.", tmp, std::make_error_code(std::errc::io_error));
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        ofs.flush();
        if (!ofs)
        {
            ofs.close();
            std::filesystem::remove(tmp, ec);
            return io_failure("Cannot write temporary file.", tmp, std::make_error_code(std::errc::io_error));
        }
    }

    std::filesystem::rename(tmp, target, ec);
    if (ec)
    {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return io_failure("Cannot move file into place.", target, ec);
    }
    return ok();
}

} // namespace detail

/**
 * Writing all rendered artifacts below the given layout.
 *
 * Files whose content is already up to date are left untouched. Files of
 * accounts no longer in the set are not pruned, and the first failure stops
 * the run with the earlier files already replaced.
 */
[[nodiscard]] inline result<write_report> write_artifacts(const artifact_set& set, const output_layout& layout)
{
    write_report report;
    for (const auto& file : render_artifacts(set))
    {
        const auto target = layout.resolve(file);
        if (auto existing = detail::read_existing(target); existing && *existing == file.content)
        {
            SYNCGEN_DEBUG("unchanged " + target.string());
            ++report.unchanged;
            continue;
        }
        SYNCGEN_TRY_VOID(detail::replace_file(target, file.content));
        SYNCGEN_INFO("wrote " + target.string());
        ++report.written;
    }
    return ok(report);
}

} // namespace syncgen
