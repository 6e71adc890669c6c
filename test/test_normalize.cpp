/*

test_normalize.cpp
------------------

Defaulting and validation of single accounts.


Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE normalize_test

#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include <syncgen/account/defaults.hpp>
#include <syncgen/detail/error_detail.hpp>

using syncgen::account;
using syncgen::errc;
using syncgen::detail::find_detail;


static account make_account(const std::string& name)
{
    account acc;
    acc.name = name;
    acc.enabled = true;
    acc.mailboxes = {"INBOX"};
    acc.imap.host = "imap.example.com";
    acc.maildir_abs_path = "/home/u/mail/" + name;
    acc.user_name = "u@example.com";
    acc.password_cmd = syncgen::password_command{std::string("pass show ") + name};
    acc.service.interval_sec = 120;
    return acc;
}


BOOST_AUTO_TEST_CASE(defaults_are_applied)
{
    auto res = syncgen::normalize(make_account("work"));
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(res->port == 993);
    BOOST_TEST(res->service_name == "imapmaildir-sync-work");
    BOOST_TEST(res->interval_sec == 120);
    BOOST_TEST(res->password_cmd == std::vector<std::string>{"pass show work"});
}

BOOST_AUTO_TEST_CASE(explicit_values_are_kept)
{
    auto acc = make_account("personal");
    acc.imap.port = 1993;
    acc.service.name = "mail-personal";
    acc.password_cmd = syncgen::password_command{std::vector<std::string>{"secret-tool", "lookup", "account", "personal"}};

    auto res = syncgen::normalize(acc);
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(res->port == 1993);
    BOOST_TEST(res->service_name == "mail-personal");
    BOOST_TEST(res->password_cmd.size() == 4u);
    BOOST_TEST(res->password_cmd.front() == "secret-tool");
}

BOOST_AUTO_TEST_CASE(default_interval)
{
    account acc = make_account("work");
    acc.service = syncgen::service_options{};
    auto res = syncgen::normalize(acc);
    BOOST_REQUIRE(res.has_value());
    BOOST_TEST(res->interval_sec == syncgen::default_interval_sec);
}

BOOST_AUTO_TEST_CASE(empty_name_rejected)
{
    auto res = syncgen::normalize(make_account(""));
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code == errc::invalid_account_name);
}

BOOST_AUTO_TEST_CASE(unsafe_names_rejected)
{
    for (const char* name : {"a/b", "..", "with space", "tab\tname"})
    {
        auto res = syncgen::normalize(make_account(name));
        BOOST_REQUIRE(!res);
        BOOST_TEST(res.error().code == errc::invalid_account_name);
    }
}

BOOST_AUTO_TEST_CASE(missing_host)
{
    auto acc = make_account("work");
    acc.imap.host.clear();
    auto res = syncgen::normalize(acc);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code == errc::missing_required_field);
    BOOST_TEST(find_detail(res.error().detail, "field") == "imap.host");
    BOOST_TEST(find_detail(res.error().detail, "account") == "work");
}

BOOST_AUTO_TEST_CASE(missing_maildir)
{
    auto acc = make_account("work");
    acc.maildir_abs_path.clear();
    auto res = syncgen::normalize(acc);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code == errc::missing_required_field);
    BOOST_TEST(find_detail(res.error().detail, "field") == "maildirAbsPath");
}

BOOST_AUTO_TEST_CASE(missing_password_command)
{
    auto acc = make_account("work");
    acc.password_cmd.reset();
    auto res = syncgen::normalize(acc);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code == errc::missing_credential_source);
}

BOOST_AUTO_TEST_CASE(empty_password_program)
{
    auto acc = make_account("work");
    acc.password_cmd = syncgen::password_command{std::vector<std::string>{}};
    auto res = syncgen::normalize(acc);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code == errc::missing_credential_source);
}

BOOST_AUTO_TEST_CASE(non_positive_interval)
{
    for (std::int64_t interval : {std::int64_t{0}, std::int64_t{-5}})
    {
        auto acc = make_account("work");
        acc.service.interval_sec = interval;
        auto res = syncgen::normalize(acc);
        BOOST_REQUIRE(!res);
        BOOST_TEST(res.error().code == errc::invalid_interval);
        BOOST_TEST(find_detail(res.error().detail, "value") == std::to_string(interval));
    }
}

BOOST_AUTO_TEST_CASE(port_out_of_range)
{
    auto acc = make_account("work");
    acc.imap.port = 70000;
    auto res = syncgen::normalize(acc);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code == errc::invalid_port);
}

BOOST_AUTO_TEST_CASE(invalid_service_name)
{
    auto acc = make_account("work");
    acc.service.name = "mail sync";
    auto res = syncgen::normalize(acc);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code == errc::invalid_service_name);
}

BOOST_AUTO_TEST_CASE(newline_in_value_rejected)
{
    auto acc = make_account("work");
    acc.user_name = "u@example.com\nExecStart=/bin/sh";
    auto res = syncgen::normalize(acc);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code == errc::invalid_field_value);
    BOOST_TEST(find_detail(res.error().detail, "field") == "userName");
}

BOOST_AUTO_TEST_CASE(newline_in_extra_config_rejected)
{
    auto acc = make_account("work");
    acc.service.extra_config["Service"]["Environment"] = syncgen::unit_value{std::string("A=1\nB=2")};
    auto res = syncgen::normalize(acc);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code == errc::invalid_field_value);
}

BOOST_AUTO_TEST_CASE(bad_extra_config_key_rejected)
{
    auto acc = make_account("work");
    acc.service.extra_config["Service"]["Nice=1"] = syncgen::unit_value{std::int64_t{10}};
    auto res = syncgen::normalize(acc);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code == errc::invalid_field_value);
}

BOOST_AUTO_TEST_CASE(trailing_backslash_in_extra_config_rejected)
{
    auto acc = make_account("work");
    acc.service.extra_config["Service"]["Environment"] = syncgen::unit_value{std::string("FOO=bar\\")};
    auto res = syncgen::normalize(acc);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code == errc::invalid_field_value);
    BOOST_TEST(find_detail(res.error().detail, "field") == "service.extraConfig.Service.Environment");
}

BOOST_AUTO_TEST_CASE(trailing_backslash_in_extra_config_list_rejected)
{
    auto acc = make_account("work");
    acc.service.extra_config["Service"]["Environment"] =
        syncgen::unit_value{std::vector<std::string>{"A=1", "B=2\\"}};
    auto res = syncgen::normalize(acc);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code == errc::invalid_field_value);
}

BOOST_AUTO_TEST_CASE(inner_backslash_in_extra_config_kept)
{
    auto acc = make_account("work");
    acc.service.extra_config["Service"]["Environment"] = syncgen::unit_value{std::string("PATTERN=a\\b")};
    BOOST_TEST(syncgen::normalize(acc).has_value());
}

BOOST_AUTO_TEST_CASE(trailing_backslash_in_names_rejected)
{
    auto res = syncgen::normalize(make_account("work\\"));
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code == errc::invalid_account_name);

    auto acc = make_account("work");
    acc.service.name = "mail\\";
    res = syncgen::normalize(acc);
    BOOST_REQUIRE(!res);
    BOOST_TEST(res.error().code == errc::invalid_service_name);
}
