/*

test_compile_registry.cpp
-------------------------

Filtering, aggregation and collision detection over a whole registry.


Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE compile_registry_test

#include <boost/test/unit_test.hpp>

#include <cstddef>
#include <string>
#include <vector>

#include <syncgen/compiler.hpp>
#include <syncgen/detail/error_detail.hpp>
#include <syncgen/emit/writer.hpp>
#include <syncgen/throwing.hpp>

using syncgen::account;
using syncgen::errc;
using syncgen::detail::find_detail;


static account make_account(const std::string& name, bool enabled = true)
{
    account acc;
    acc.name = name;
    acc.enabled = enabled;
    acc.mailboxes = {"INBOX"};
    acc.imap.host = "imap.example.com";
    acc.maildir_abs_path = "/home/u/mail/" + name;
    acc.user_name = name + "@example.com";
    acc.password_cmd = syncgen::password_command{std::string("pass show ") + name};
    return acc;
}

struct quiet_log
{
    quiet_log() { syncgen::log::logger::instance().set_level(syncgen::log::level::off); }
};

BOOST_GLOBAL_FIXTURE(quiet_log);


BOOST_AUTO_TEST_CASE(empty_registry)
{
    auto set = syncgen::compile_registry({});
    BOOST_REQUIRE(set.has_value());
    BOOST_TEST(set->empty());
}

BOOST_AUTO_TEST_CASE(disabled_accounts_produce_nothing)
{
    auto set = syncgen::compile_registry({make_account("work", false), make_account("home", false)});
    BOOST_REQUIRE(set.has_value());
    BOOST_TEST(set->empty());
}

BOOST_AUTO_TEST_CASE(disabled_accounts_are_not_validated)
{
    auto broken = make_account("old", false);
    broken.imap.host.clear();
    broken.password_cmd.reset();

    auto set = syncgen::compile_registry({make_account("work"), broken});
    BOOST_REQUIRE(set.has_value());
    BOOST_TEST(set->services.size() == 1u);
}

BOOST_AUTO_TEST_CASE(one_of_each_per_enabled_account)
{
    auto set = syncgen::compile_registry({make_account("work"), make_account("old", false), make_account("home")});
    BOOST_REQUIRE(set.has_value());
    BOOST_TEST(set->services.size() == 2u);
    BOOST_TEST(set->timers.size() == 2u);
    BOOST_TEST(set->config_files.size() == 2u);

    BOOST_TEST(set->services.contains("imapmaildir-sync-work"));
    BOOST_TEST(set->services.contains("imapmaildir-sync-home"));
    BOOST_TEST(!set->services.contains("imapmaildir-sync-old"));
    BOOST_TEST(set->timers.contains("imapmaildir-sync-home"));
    BOOST_TEST(set->config_files.contains("imapmaildir/accounts/home.toml"));

    const auto* svc = set->services.find("imapmaildir-sync-work");
    BOOST_REQUIRE(svc != nullptr);
    BOOST_TEST(svc->account == "work");
}

BOOST_AUTO_TEST_CASE(insertion_order_is_registry_order)
{
    auto set = syncgen::compile_registry({make_account("zeta"), make_account("alpha")});
    BOOST_REQUIRE(set.has_value());
    std::vector<std::string> keys;
    for (const auto& svc : set->services)
        keys.push_back(svc.account);
    BOOST_TEST(keys == (std::vector<std::string>{"zeta", "alpha"}));
}

BOOST_AUTO_TEST_CASE(colliding_service_names_fail)
{
    auto first = make_account("work");
    first.service.name = "mail";
    auto second = make_account("home");
    second.service.name = "mail";

    auto set = syncgen::compile_registry({first, second});
    BOOST_REQUIRE(!set);
    BOOST_TEST(set.error().code == errc::duplicate_artifact_key);
    BOOST_TEST(find_detail(set.error().detail, "kind") == "service");
    BOOST_TEST(find_detail(set.error().detail, "key") == "mail");
    BOOST_TEST(find_detail(set.error().detail, "account") == "work");
    BOOST_TEST(find_detail(set.error().detail, "conflicting_account") == "home");
}

BOOST_AUTO_TEST_CASE(collision_with_default_service_name)
{
    auto first = make_account("work");
    auto second = make_account("home");
    second.service.name = "imapmaildir-sync-work";

    auto set = syncgen::compile_registry({first, second});
    BOOST_REQUIRE(!set);
    BOOST_TEST(set.error().code == errc::duplicate_artifact_key);
}

BOOST_AUTO_TEST_CASE(duplicate_account_names_fail)
{
    auto set = syncgen::compile_registry({make_account("work"), make_account("work", false)});
    BOOST_REQUIRE(!set);
    BOOST_TEST(set.error().code == errc::invalid_account_name);
    BOOST_TEST(find_detail(set.error().detail, "index") == "1");
    BOOST_TEST(find_detail(set.error().detail, "first_index") == "0");
}

BOOST_AUTO_TEST_CASE(first_invalid_account_aborts)
{
    auto bad = make_account("home");
    bad.service.interval_sec = 0;

    auto set = syncgen::compile_registry({make_account("work"), bad});
    BOOST_REQUIRE(!set);
    BOOST_TEST(set.error().code == errc::invalid_interval);
    BOOST_TEST(find_detail(set.error().detail, "account") == "home");
}

BOOST_AUTO_TEST_CASE(keyed_collection_rejects_duplicates)
{
    syncgen::keyed_collection<syncgen::timer_descriptor> timers;
    syncgen::timer_descriptor a;
    a.key = "t";
    a.account = "a";
    syncgen::timer_descriptor b;
    b.key = "t";
    b.account = "b";

    BOOST_TEST(timers.insert(a).has_value());
    auto res = timers.insert(b);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code == errc::duplicate_artifact_key);
    BOOST_TEST(timers.size() == 1u);
    BOOST_TEST(timers.find("t")->account == "a");
}

BOOST_AUTO_TEST_CASE(rerun_is_idempotent)
{
    const std::vector<account> accounts{make_account("work"), make_account("home")};
    auto first = syncgen::render_artifacts(syncgen::unwrap(syncgen::compile_registry(accounts)));
    auto second = syncgen::render_artifacts(syncgen::unwrap(syncgen::compile_registry(accounts)));

    BOOST_REQUIRE(first.size() == 6u);
    BOOST_REQUIRE(second.size() == first.size());
    for (std::size_t i = 0; i < first.size(); ++i)
    {
        BOOST_TEST(first[i].path == second[i].path);
        BOOST_TEST(first[i].content == second[i].content);
    }
}

BOOST_AUTO_TEST_CASE(unwrap_throws_on_error)
{
    auto bad = make_account("work");
    bad.imap.host.clear();
    BOOST_CHECK_THROW(syncgen::unwrap(syncgen::compile_registry({bad})), syncgen::exception);

    try
    {
        (void)syncgen::unwrap(syncgen::compile_registry({bad}));
    }
    catch (const syncgen::exception& exc)
    {
        BOOST_TEST(exc.info().code == errc::missing_required_field);
    }
}
