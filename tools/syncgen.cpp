/*

syncgen.cpp
-----------

Generates the systemd user units and account configuration files of every
enabled account in a registry.

    syncgen --registry accounts.yaml [--unit-dir DIR] [--config-root DIR]
            [--binary PATH] [--dry-run | --check] [--log-level LEVEL]


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <syncgen/compiler.hpp>
#include <syncgen/detail/log.hpp>
#include <syncgen/emit/writer.hpp>
#include <syncgen/registry/yaml_loader.hpp>


namespace po = boost::program_options;
using std::cerr;
using std::cout;


namespace
{

constexpr int exit_compile_error = 1;
constexpr int exit_usage_error = 2;

void print_error(const syncgen::error_info& err)
{
    cerr << fmt::format("error: {}: {}\n", syncgen::to_string(err.code), err.message);
    std::string_view detail = err.detail;
    while (!detail.empty())
    {
        const auto eol = detail.find('\n');
        cerr << "  " << detail.substr(0, eol) << "\n";
        if (eol == std::string_view::npos)
            break;
        detail.remove_prefix(eol + 1);
    }
}

void print_rendered(const syncgen::artifact_set& set, const syncgen::output_layout& layout)
{
    for (const auto& file : syncgen::render_artifacts(set))
    {
        cout << "# " << layout.resolve(file).string() << "\n";
        cout << file.content << "\n";
    }
}

} // namespace


int main(int argc, char* argv[])
{
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "print usage")
        ("registry,r", po::value<std::string>(), "account registry (YAML)")
        ("unit-dir", po::value<std::string>(), "systemd user unit directory (default $XDG_CONFIG_HOME/systemd/user)")
        ("config-root", po::value<std::string>(), "configuration root (default $XDG_CONFIG_HOME)")
        ("binary", po::value<std::string>(), "sync program started by the services")
        ("dry-run,n", po::bool_switch(), "print the generated files instead of writing them")
        ("check", po::bool_switch(), "validate and compile only")
        ("log-level", po::value<std::string>()->default_value("warn"), "trace, debug, info, warn, error or off");

    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }
    catch (const po::error& exc)
    {
        cerr << "syncgen: " << exc.what() << "\n" << desc << "\n";
        return exit_usage_error;
    }

    if (vm.count("help"))
    {
        cout << "usage: syncgen --registry FILE [options]\n" << desc << "\n"
             << "Files of accounts removed or disabled since the last run are not deleted;\n"
             << "remove their units and run `systemctl --user daemon-reload` by hand.\n"
             << "A failed write stops the run, files written before it stay updated.\n";
        return EXIT_SUCCESS;
    }

    auto lvl = syncgen::log::level_from_string(vm["log-level"].as<std::string>());
    if (!lvl)
    {
        cerr << "syncgen: unknown log level '" << vm["log-level"].as<std::string>() << "'\n";
        return exit_usage_error;
    }
    syncgen::log::logger::instance().set_level(*lvl);

    if (!vm.count("registry"))
    {
        cerr << "syncgen: --registry is required\n" << desc << "\n";
        return exit_usage_error;
    }

    const bool dry_run = vm["dry-run"].as<bool>();
    const bool check_only = vm["check"].as<bool>();
    if (dry_run && check_only)
    {
        cerr << "syncgen: --dry-run and --check are exclusive\n";
        return exit_usage_error;
    }

    auto reg = syncgen::load_registry(vm["registry"].as<std::string>());
    if (!reg)
    {
        print_error(reg.error());
        return exit_compile_error;
    }

    std::optional<std::string> binary;
    if (vm.count("binary"))
        binary = vm["binary"].as<std::string>();

    auto set = syncgen::compile_registry(reg->accounts, reg->options(binary));
    if (!set)
    {
        print_error(set.error());
        return exit_compile_error;
    }

    if (check_only)
    {
        cout << fmt::format("{} account(s) ok: {} service(s), {} timer(s), {} config file(s)\n",
            set->services.size(), set->services.size(), set->timers.size(), set->config_files.size());
        return EXIT_SUCCESS;
    }

    auto layout = syncgen::output_layout::from_environment().value_or(syncgen::output_layout{});
    if (vm.count("unit-dir"))
        layout.unit_dir = vm["unit-dir"].as<std::string>();
    if (vm.count("config-root"))
        layout.config_root = vm["config-root"].as<std::string>();
    if (layout.unit_dir.empty() || layout.config_root.empty())
    {
        cerr << "syncgen: HOME is not set, pass --unit-dir and --config-root\n";
        return exit_usage_error;
    }

    if (dry_run)
    {
        print_rendered(*set, layout);
        return EXIT_SUCCESS;
    }

    auto report = syncgen::write_artifacts(*set, layout);
    if (!report)
    {
        print_error(report.error());
        return exit_compile_error;
    }
    cout << fmt::format("{} file(s) written, {} unchanged\n", report->written, report->unchanged);
    return EXIT_SUCCESS;
}
