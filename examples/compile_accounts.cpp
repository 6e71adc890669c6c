/*

compile_accounts.cpp
--------------------

Builds a small registry in code, compiles it and prints the generated units
and configuration files.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include <syncgen/syncgen.hpp>
#include <syncgen/throwing.hpp>


using syncgen::account;
using std::cout;
using std::endl;


int main()
{
    syncgen::log::logger::instance().set_level(syncgen::log::level::debug);
    syncgen::log::logger::instance().set_callback([](const syncgen::log::entry& e)
    {
        std::cerr << "[" << syncgen::log::level_to_string(e.lvl) << "] " << e.message << "\n";
    });

    account work;
    work.name = "work";
    work.enabled = true;
    work.mailboxes = {"INBOX", "Archive"};
    work.imap.host = "imap.example.com";
    work.maildir_abs_path = "/home/u/mail/work";
    work.user_name = "u@example.com";
    work.password_cmd = syncgen::password_command{std::string("pass show work")};
    work.service.interval_sec = 120;
    work.service.extra_config["Service"]["Nice"] = syncgen::unit_value{std::int64_t{10}};

    account personal;
    personal.name = "personal";
    personal.enabled = false;

    try
    {
        auto set = syncgen::unwrap(syncgen::compile_registry({work, personal}));
        for (const auto& file : syncgen::render_artifacts(set))
        {
            cout << "# " << file.path.string() << endl;
            cout << file.content << endl;
        }
    }
    catch (const syncgen::exception& exc)
    {
        cout << syncgen::to_string(exc.info().code) << ": " << exc.what() << endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
