/*

test_toml_encoder.cpp
---------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE toml_encoder_test

#include <boost/test/unit_test.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <syncgen/codec/toml.hpp>

using syncgen::toml_encoder;
namespace toml = syncgen::toml;


BOOST_AUTO_TEST_CASE(scalars_before_tables)
{
    toml::table auth;
    auth.set("user", toml::scalar{std::string("u@example.com")});

    toml::table doc;
    doc.set_table("auth", auth);
    doc.set("host", toml::scalar{std::string("imap.example.com")});
    doc.set("port", toml::scalar{std::int64_t{993}});
    doc.set("tls", toml::scalar{true});

    toml_encoder enc;
    const std::string expected =
        "host = \"imap.example.com\"\n"
        "port = 993\n"
        "tls = true\n"
        "\n"
        "[auth]\n"
        "user = \"u@example.com\"\n";
    BOOST_TEST(enc.encode(doc) == expected);
}

BOOST_AUTO_TEST_CASE(string_arrays)
{
    toml::table doc;
    doc.set("mailboxes", toml::scalar{std::vector<std::string>{"INBOX", "Sent Items"}});
    doc.set("empty", toml::scalar{std::vector<std::string>{}});

    toml_encoder enc;
    BOOST_TEST(enc.encode(doc) == "mailboxes = [\"INBOX\", \"Sent Items\"]\nempty = []\n");
}

BOOST_AUTO_TEST_CASE(set_replaces_in_place)
{
    toml::table doc;
    doc.set("a", toml::scalar{std::int64_t{1}});
    doc.set("b", toml::scalar{std::int64_t{2}});
    doc.set("a", toml::scalar{std::int64_t{3}});

    BOOST_TEST(doc.values().size() == 2u);
    BOOST_TEST(doc.values().front().first == "a");
    const auto* a = std::get_if<std::int64_t>(doc.find("a"));
    BOOST_REQUIRE(a != nullptr);
    BOOST_TEST(*a == 3);
}

BOOST_AUTO_TEST_CASE(string_escapes)
{
    BOOST_TEST(toml_encoder::quote("say \"hi\"") == "\"say \\\"hi\\\"\"");
    BOOST_TEST(toml_encoder::quote("C:\\mail") == "\"C:\\\\mail\"");
    BOOST_TEST(toml_encoder::quote("a\tb") == "\"a\\tb\"");
    BOOST_TEST(toml_encoder::quote(std::string("\x01", 1)) == "\"\\u0001\"");
}

BOOST_AUTO_TEST_CASE(keys)
{
    BOOST_TEST(toml_encoder::encode_key("password_cmd") == "password_cmd");
    BOOST_TEST(toml_encoder::encode_key("maildir-path") == "maildir-path");
    BOOST_TEST(toml_encoder::encode_key("with space") == "\"with space\"");
    BOOST_TEST(toml_encoder::encode_key("a.b") == "\"a.b\"");
}

BOOST_AUTO_TEST_CASE(nested_table_path)
{
    toml::table inner;
    inner.set("x", toml::scalar{std::int64_t{1}});
    toml::table outer;
    outer.set_table("inner", inner);
    toml::table doc;
    doc.set_table("outer", outer);

    toml_encoder enc;
    BOOST_TEST(enc.encode(doc) == "[outer]\n\n[outer.inner]\nx = 1\n");
}
