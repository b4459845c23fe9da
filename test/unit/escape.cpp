//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

// Test that header file is self-contained.
#include <boost/safestring/escape.hpp>

#include "test_helpers.hpp"

#include <stdexcept>

namespace boost {
namespace safestring {

struct escape_test
{
    static constexpr context bad_context =
        static_cast<context>(42);

    void
    test_escape_for()
    {
        check_ok(escape_for(context::markup, "<b>"), "&lt;b&gt;");
        check_ok(escape_for(context::structured_data, "x"), "\"x\"");
        check_ok(escape_for(context::url, "HTTP://h/a b"), "http://h/a%20b");
        check_ok(escape_for(context::query_argument, "a b"), "a+b");
        check_ok(escape_for(context::email_address, "to: a@b.com"), "a@b.com");
        check_ok(escape_for(context::parameterized_text, "O'Brien"), "'O\\'Brien'");

        check_err(
            escape_for(context::email_address, "none"),
            error::no_address_found);
        check_err(
            escape_for(context::url, "http://[x/"),
            error::malformed_encoding);
        check_err(
            escape_for(bad_context, "x"),
            error::unimplemented_context);
    }

    void
    test_escape_config()
    {
        escape_config cfg;
        cfg.query.space_as_plus = false;
        cfg.url.normalize = false;
        cfg.sql.quote = '"';
        check_ok(escape_for(context::query_argument, "a b", cfg), "a%20b");
        check_ok(escape_for(context::url, "HTTP://h/./x", cfg), "HTTP://h/./x");
        check_ok(escape_for(context::parameterized_text, "v", cfg), "\"v\"");

        // an invalid configuration is rejected for every context
        cfg.sql.quote = '#';
        BOOST_TEST_THROWS(
            escape_for(context::markup, "x", cfg),
            std::invalid_argument);
        BOOST_TEST_THROWS(
            escape_for(context::parameterized_text, "x", cfg),
            std::invalid_argument);
    }

    void
    test_unescape_for()
    {
        check_ok(unescape_for(context::markup, "&lt;b&gt;"), "<b>");
        check_ok(unescape_for(context::structured_data, "\"x\""), "x");
        check_ok(unescape_for(context::url, "/a%20b"), "/a%20b");
        check_ok(unescape_for(context::query_argument, "a+b%21"), "a b!");
        check_ok(unescape_for(context::email_address, "a@b.com"), "a@b.com");

        check_err(
            unescape_for(context::parameterized_text, "'x'"),
            error::not_reversible);
        check_err(
            unescape_for(context::structured_data, "42"),
            error::type_mismatch);
        check_err(
            unescape_for(context::query_argument, "%zz"),
            error::malformed_encoding);
        check_err(
            unescape_for(bad_context, "x"),
            error::unimplemented_context);
    }

    void
    test_round_trip()
    {
        char const* const v[] = {
            "",
            "plain",
            "<tag attr='v'>&amp;</tag>",
            "line\nbreak \"quoted\" 100%",
            "caf\xc3\xa9"
        };
        context const reversible[] = {
            context::markup,
            context::structured_data,
            context::query_argument };
        for(auto c : reversible)
        {
            for(auto s : v)
            {
                auto e = escape_for(c, s);
                if(! BOOST_TEST(e.has_value()))
                    continue;
                check_ok(unescape_for(c, *e), s);
            }
        }
    }

    void
    test_upgrade()
    {
        check_ok(
            upgrade(context::markup, context::structured_data, "\"<x>\""),
            "&lt;x&gt;");
        check_ok(
            upgrade(context::structured_data, context::markup, "&lt;x&gt;"),
            "\"<x>\"");
        check_ok(
            upgrade(context::parameterized_text, context::markup, "a&amp;b"),
            "'a&b'");
        check_ok(
            upgrade(context::query_argument, context::url, "http://x/?a=b"),
            "http%3A%2F%2Fx%2F%3Fa%3Db");
        check_ok(
            upgrade(context::url, context::query_argument, "a%2Fb+c"),
            "a/b%20c");
        check_ok(
            upgrade(context::email_address, context::markup, "Joe &lt;joe@x.org&gt;"),
            "joe@x.org");
        check_ok(
            upgrade(context::query_argument, context::markup, "caf&eacute;"),
            "caf%C3%A9");

        // same context, used verbatim
        check_ok(upgrade(context::markup, context::markup, "<raw>"), "<raw>");
        check_ok(
            upgrade(context::parameterized_text, context::parameterized_text, "'a'"),
            "'a'");

        check_err(
            upgrade(context::markup, context::parameterized_text, "'x'"),
            error::not_reversible);
        check_err(
            upgrade(context::markup, context::structured_data, "42"),
            error::type_mismatch);
        check_err(
            upgrade(context::email_address, context::markup, "nobody"),
            error::no_address_found);
        check_err(
            upgrade(bad_context, context::markup, "x"),
            error::unimplemented_context);
        check_err(
            upgrade(context::markup, bad_context, "x"),
            error::unimplemented_context);
        check_err(
            upgrade(bad_context, bad_context, "x"),
            error::unimplemented_context);
    }

    void
    run()
    {
        test_escape_for();
        test_escape_config();
        test_unescape_for();
        test_round_trip();
        test_upgrade();
    }
};

TEST_SUITE(
    escape_test,
    "boost.safestring.escape");

} // safestring
} // boost
