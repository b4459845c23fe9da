//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#include <boost/safestring/safe_string.hpp>

#include "test_helpers.hpp"

namespace boost {
namespace safestring {

struct format_test
{
    template<context C, class... Args>
    static
    void
    check(
        core::string_view tpl,
        core::string_view expected,
        Args const&... args)
    {
        auto rv = basic_safe_string<C>::from_trusted(
            tpl).try_format(args...);
        if(! BOOST_TEST(rv.has_value()))
        {
            BOOST_LIGHTWEIGHT_TEST_OSTREAM
                << "  error: " << rv.error().message()
                << std::endl;
            return;
        }
        BOOST_TEST_EQ(rv->str(), expected);
    }

    template<context C, class... Args>
    static
    void
    check_fails(
        core::string_view tpl,
        error expected,
        Args const&... args)
    {
        check_err(
            basic_safe_string<C>::from_trusted(
                tpl).try_format(args...),
            expected);
    }

    void
    test_automatic()
    {
        constexpr auto M = context::markup;
        check<M>("", "");
        check<M>("plain", "plain");
        check<M>("<p>{}</p>", "<p>&lt;b&gt;</p>", "<b>");
        check<M>("{}{}", "a&amp;b", "a&", "b");
        check<M>("<p>{}</p>", "<p>x</p>", std::string("x"));
        check<M>("{{}}", "{}");
        check<M>("{{{}}}", "{&lt;}", "<");
    }

    void
    test_manual()
    {
        constexpr auto M = context::markup;
        check<M>("{1}{0}", "&lt;a", "a", "<");
        check<M>("{0}{0}", "&amp;&amp;", "&");
        check<M>("{0}", "a", "a", "unused");
    }

    void
    test_named()
    {
        constexpr auto M = context::markup;
        check<M>(
            "<a href=\"{url}\">{text}</a>",
            "<a href=\"http://x/?a=1&amp;b=2\">&lt;me&gt;</a>",
            arg("text", "<me>"),
            arg("url", url_string::from_untrusted("http://x/?a=1&b=2")));

        // positions count unnamed arguments only
        check<M>("{} {n} {}", "a b c", "a", arg("n", "b"), "c");
        check<M>("{1}-{n}", "c-b", "a", arg("n", "b"), "c");
        check<M>("{_id2}", "7", arg("_id2", 7));
    }

    void
    test_integers()
    {
        constexpr auto M = context::markup;
        check<M>("{} {} {}", "42 -7 0", 42, -7L, 0u);
        check<M>(
            "{}", "18446744073709551615",
            18446744073709551615ull);
        check<context::parameterized_text>(
            "LIMIT {}", "LIMIT '10'", 10);
    }

    void
    test_upgrade()
    {
        // safe arguments are upgraded, never escaped twice
        check<context::markup>(
            "<p>{}</p>", "<p>&lt;b&gt;</p>",
            html_string::from_untrusted("<b>"));
        check<context::structured_data>(
            "{{\"name\": {}}}", "{\"name\": \"<x>\"}",
            html_string::from_untrusted("<x>"));
        check<context::structured_data>(
            "[{}, {}]", "[\"a\\\"\", \"b\"]",
            "a\"", json_string::from_untrusted("b"));
        check<context::parameterized_text>(
            "SELECT * FROM t WHERE a = {} AND b = {}",
            "SELECT * FROM t WHERE a = 'x\\'' AND b = 'y'",
            "x'", html_string::from_untrusted("y"));
        check<context::markup>(
            "{}", "a b",
            make_safe_string(
                context::query_argument, "a+b", trust::trusted));
    }

    void
    test_errors()
    {
        constexpr auto M = context::markup;
        check_fails<M>("{", error::bad_format_string);
        check_fails<M>("}", error::bad_format_string);
        check_fails<M>("a}b", error::bad_format_string, "x");
        check_fails<M>("{0", error::bad_format_string, "x");
        check_fails<M>("{:x}", error::bad_format_string, "x");
        check_fails<M>("{0:>4}", error::bad_format_string, "x");
        check_fails<M>("{-1}", error::bad_format_string, "x");
        check_fails<M>("{a b}", error::bad_format_string, "x");
        check_fails<M>("{0}{}", error::bad_format_string, "x");
        check_fails<M>("{}{0}", error::bad_format_string, "x");

        check_fails<M>("{}", error::missing_argument);
        check_fails<M>("{}{}", error::missing_argument, "x");
        check_fails<M>("{1}", error::missing_argument, "x");
        check_fails<M>("{1234567890}", error::missing_argument, "x");
        check_fails<M>("{name}", error::missing_argument, "x");
        check_fails<M>("{}", error::missing_argument, arg("n", "x"));

        // every argument is upgraded, used or not
        check_fails<context::email_address>(
            "{}", error::no_address_found,
            "joe@x.org", "nobody");
        check_fails<M>(
            "{}", error::not_reversible,
            "x", sql_string::from_untrusted("y"));
    }

    void
    test_throwing()
    {
        auto const t = html_string::from_trusted("<i>{}</i>");
        BOOST_TEST_EQ(t.format("&").str(), "<i>&amp;</i>");
        BOOST_TEST_THROWS(
            t.format(),
            system::system_error);
        BOOST_TEST_THROWS(
            html_string::from_trusted("{").format(),
            system::system_error);

        // the template itself is not modified
        BOOST_TEST_EQ(t.str(), "<i>{}</i>");
    }

    void
    test_any()
    {
        auto const a = make_safe_string(
            context::markup, "<i>{}</i>", trust::trusted);
        auto const r = a.format("&");
        BOOST_TEST(r.kind() == context::markup);
        BOOST_TEST_EQ(r.str(), "<i>&amp;</i>");

        auto const q = make_safe_string(
            context::query_argument, "{}", trust::trusted);
        auto rv = q.try_format(html_string::from_untrusted("a&b"));
        if(BOOST_TEST(rv.has_value()))
            BOOST_TEST_EQ(rv->str(), "a%26b");

        check_err(q.try_format(), error::missing_argument);
    }

    void
    run()
    {
        test_automatic();
        test_manual();
        test_named();
        test_integers();
        test_upgrade();
        test_errors();
        test_throwing();
        test_any();
    }
};

TEST_SUITE(
    format_test,
    "boost.safestring.format");

} // safestring
} // boost
