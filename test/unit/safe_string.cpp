//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

// Test that header file is self-contained.
#include <boost/safestring/safe_string.hpp>

#include "test_helpers.hpp"

#include <sstream>
#include <type_traits>
#include <unordered_set>

namespace boost {
namespace safestring {

// only the factories produce safe strings
static_assert(
    ! std::is_constructible<html_string, std::string>::value,
    "");
static_assert(
    ! std::is_convertible<char const*, html_string>::value,
    "");
static_assert(
    ! std::is_convertible<json_string, html_string>::value,
    "");
static_assert(
    std::is_convertible<html_string, core::string_view>::value,
    "");
static_assert(html_string::tag == context::markup, "");
static_assert(sql_string::tag == context::parameterized_text, "");

struct safe_string_test
{
    template<class F>
    static
    void
    check_throws(
        F const& f,
        error expected)
    {
        try
        {
            f();
            BOOST_ERROR("exception expected");
        }
        catch(system::system_error const& e)
        {
            BOOST_TEST(e.code() == expected);
        }
    }

    void
    test_construct()
    {
        html_string h;
        BOOST_TEST(h.empty());
        BOOST_TEST_EQ(h.size(), 0u);
        BOOST_TEST_EQ(std::string(h.c_str()), "");

        h = html_string::from_untrusted("<b>");
        BOOST_TEST_EQ(h.str(), "&lt;b&gt;");
        BOOST_TEST_EQ(h.size(), 9u);
        BOOST_TEST_EQ(core::string_view(h), "&lt;b&gt;");
        BOOST_TEST_EQ(std::string(h.data(), h.size()), "&lt;b&gt;");

        h = html_string::from_trusted("<b>bold</b>");
        BOOST_TEST_EQ(h.str(), "<b>bold</b>");

        BOOST_TEST_EQ(json_string::from_untrusted("a\"b").str(), "\"a\\\"b\"");
        BOOST_TEST_EQ(url_string::from_untrusted("http://x/a b").str(), "http://x/a%20b");
        BOOST_TEST_EQ(query_argument_string::from_untrusted("a&b").str(), "a%26b");
        BOOST_TEST_EQ(
            email_address_string::from_untrusted("To: a@b.com\r\nBcc: c@d.com").str(),
            "a@b.com");
        BOOST_TEST_EQ(sql_string::from_untrusted("x").str(), "'x'");
    }

    void
    test_construct_errors()
    {
        auto rv = email_address_string::try_from_untrusted("nobody");
        check_err(rv, error::no_address_found);

        check_throws([]
        {
            email_address_string::from_untrusted("nobody");
        }, error::no_address_found);

        check_err(
            url_string::try_from_untrusted("http://[x/"),
            error::malformed_encoding);
    }

    void
    test_template()
    {
        auto s = sql_string::from_template(
            "SELECT * FROM t WHERE name = %s", { "x' OR '1'='1" });
        BOOST_TEST_EQ(
            s.str(),
            "SELECT * FROM t WHERE name = 'x\\' OR \\'1\\'=\\'1'");

        auto rv = sql_string::try_from_template("%s, %s", { "a" });
        check_err(rv, error::placeholder_count_mismatch);

        check_throws([]
        {
            sql_string::from_template("%s", {});
        }, error::placeholder_count_mismatch);
    }

    void
    test_combine()
    {
        auto h = html_string::from_untrusted("<b>");

        // untrusted text is escaped
        BOOST_TEST_EQ((h + "&").str(), "&lt;b&gt;&amp;");
        BOOST_TEST_EQ((h + std::string("'")).str(), "&lt;b&gt;&#39;");

        // same context is used verbatim
        auto t = html_string::from_trusted("<i>");
        BOOST_TEST_EQ((t + t).str(), "<i><i>");

        // other contexts are upgraded
        BOOST_TEST_EQ(
            (html_string::from_untrusted("<script>") +
                json_string::from_untrusted("x")).str(),
            "&lt;script&gt;x");
        BOOST_TEST_EQ(
            (html_string::from_trusted("<p>") +
                json_string::from_trusted("\"</p>\"")).str(),
            "<p>&lt;/p&gt;");
        BOOST_TEST_EQ(
            (json_string::from_trusted("") +
                email_address_string::from_untrusted("a@b.com")).str(),
            "\"a@b.com\"");
        BOOST_TEST_EQ(
            (url_string::from_trusted("http://x/?q=") +
                query_argument_string::from_untrusted("a b")).str(),
            "http://x/?q=a%20b");
        BOOST_TEST_EQ(
            (sql_string::from_trusted("WHERE a = ") +
                html_string::from_untrusted("O'Brien")).str(),
            "WHERE a = 'O\\'Brien'");

        // the left operand keeps its context
        auto q = query_argument_string::from_untrusted("a") +
            html_string::from_trusted("&amp;");
        static_assert(decltype(q)::tag == context::query_argument, "");
        BOOST_TEST_EQ(q.str(), "a%26");
    }

    void
    test_combine_errors()
    {
        auto h = html_string::from_trusted("x");
        auto s = sql_string::from_untrusted("y");

        check_err(h.try_append(s), error::not_reversible);
        check_throws([&]
        {
            auto r = h + s;
            (void)r;
        }, error::not_reversible);

        // the left operand is unchanged
        BOOST_TEST_EQ(h.str(), "x");

        auto e = email_address_string::from_trusted("a@b.com");
        check_err(
            e.try_append(html_string::from_trusted("none")),
            error::no_address_found);
    }

    void
    test_append_assign()
    {
        auto h = html_string::from_trusted("<ul>");
        h += "<li>";
        h += html_string::from_trusted("</ul>");
        h += json_string::from_untrusted("&");
        BOOST_TEST_EQ(h.str(), "<ul>&lt;li&gt;</ul>&amp;");

        auto s = sql_string::from_untrusted("v");
        check_throws([&]
        {
            h += s;
        }, error::not_reversible);
        BOOST_TEST_EQ(h.str(), "<ul>&lt;li&gt;</ul>&amp;");
    }

    void
    test_compare()
    {
        auto a = html_string::from_trusted("a");
        auto b = html_string::from_trusted("b");
        BOOST_TEST(a == html_string::from_untrusted("a"));
        BOOST_TEST(a != b);
        BOOST_TEST(a < b);
        BOOST_TEST(! (b < a));

        std::unordered_set<html_string> set;
        set.insert(a);
        set.insert(html_string::from_trusted("a"));
        set.insert(b);
        BOOST_TEST_EQ(set.size(), 2u);
    }

    void
    test_ostream()
    {
        std::stringstream ss;
        ss << html_string::from_untrusted("<") << ' '
           << query_argument_string::from_untrusted(" ");
        BOOST_TEST_EQ(ss.str(), "&lt; +");
    }

    void
    run()
    {
        test_construct();
        test_construct_errors();
        test_template();
        test_combine();
        test_combine_errors();
        test_append_assign();
        test_compare();
        test_ostream();
    }
};

TEST_SUITE(
    safe_string_test,
    "boost.safestring.safe_string");

} // safestring
} // boost
