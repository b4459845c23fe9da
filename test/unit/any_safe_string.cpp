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

#include <sstream>
#include <type_traits>
#include <vector>

namespace boost {
namespace safestring {

static_assert(
    ! std::is_default_constructible<any_safe_string>::value,
    "");
static_assert(
    std::is_convertible<url_string, any_safe_string>::value,
    "");
static_assert(
    ! std::is_convertible<core::string_view, any_safe_string>::value,
    "");

struct any_safe_string_test
{
    static constexpr context bad_context =
        static_cast<context>(17);

    void
    test_make()
    {
        any_safe_string s = make_safe_string(
            context::query_argument, "a b", trust::untrusted);
        BOOST_TEST(s.kind() == context::query_argument);
        BOOST_TEST_EQ(s.str(), "a+b");
        BOOST_TEST_EQ(s.size(), 3u);
        BOOST_TEST(! s.empty());
        BOOST_TEST_EQ(core::string_view(s), "a+b");

        s = make_safe_string(
            context::markup, "<b>", trust::trusted);
        BOOST_TEST(s.kind() == context::markup);
        BOOST_TEST_EQ(s.str(), "<b>");

        s = make_safe_string(
            context::parameterized_text, "", trust::untrusted);
        BOOST_TEST_EQ(s.str(), "''");

        check_err(
            try_make_safe_string(
                context::email_address, "none", trust::untrusted),
            error::no_address_found);
        check_err(
            try_make_safe_string(
                bad_context, "x", trust::untrusted),
            error::unimplemented_context);
        check_err(
            try_make_safe_string(
                bad_context, "x", trust::trusted),
            error::unimplemented_context);
        BOOST_TEST_THROWS(
            make_safe_string(bad_context, "x", trust::trusted),
            system::system_error);
    }

    void
    test_convert()
    {
        auto const h = html_string::from_untrusted("<");
        any_safe_string a = h;
        BOOST_TEST(a.kind() == context::markup);
        BOOST_TEST_EQ(a.str(), "&lt;");

        any_safe_string b = json_string::from_untrusted("x");
        BOOST_TEST(b.kind() == context::structured_data);
        BOOST_TEST_EQ(b.str(), "\"x\"");

        // a heterogeneous collection
        std::vector<any_safe_string> v;
        v.push_back(h);
        v.push_back(sql_string::from_untrusted("y"));
        v.push_back(url_string::from_untrusted("/p"));
        BOOST_TEST(v[0].kind() == context::markup);
        BOOST_TEST(v[1].kind() == context::parameterized_text);
        BOOST_TEST(v[2].kind() == context::url);
    }

    void
    test_append()
    {
        auto const a = make_safe_string(
            context::markup, "<p>", trust::trusted);

        BOOST_TEST_EQ(a.append("&").str(), "<p>&amp;");
        BOOST_TEST_EQ(
            a.append(json_string::from_untrusted("</p>")).str(),
            "<p>&lt;/p&gt;");
        BOOST_TEST_EQ(
            a.append(make_safe_string(
                context::query_argument, "a+b", trust::trusted)).str(),
            "<p>a b");
        BOOST_TEST(a.append("x").kind() == context::markup);

        auto const s = make_safe_string(
            context::parameterized_text, "'v'", trust::trusted);
        check_err(a.try_append(s), error::not_reversible);
        BOOST_TEST_THROWS(a.append(s), system::system_error);

        // appending to a string of another context
        auto const q = make_safe_string(
            context::query_argument, "k=", trust::trusted);
        auto rv = q.try_append("a&b");
        if(BOOST_TEST(rv.has_value()))
        {
            BOOST_TEST(rv->kind() == context::query_argument);
            BOOST_TEST_EQ(rv->str(), "k=a%26b");
        }

        // typed strings accept any_safe_string operands
        auto h = html_string::from_trusted("<b>") + q;
        BOOST_TEST_EQ(h.str(), "<b>k=");
        check_err(
            html_string::from_trusted("").try_append(s),
            error::not_reversible);
    }

    void
    test_as()
    {
        auto const a = make_safe_string(
            context::markup, "&lt;x&gt;", trust::trusted);

        auto j = a.as<context::structured_data>();
        if(BOOST_TEST(j.has_value()))
            BOOST_TEST_EQ(j->str(), "\"<x>\"");

        auto h = a.as<context::markup>();
        if(BOOST_TEST(h.has_value()))
            BOOST_TEST_EQ(h->str(), "&lt;x&gt;");

        auto const s = make_safe_string(
            context::parameterized_text, "'x'", trust::trusted);
        check_err(
            s.as<context::markup>(),
            error::not_reversible);
    }

    void
    test_compare()
    {
        auto const a = make_safe_string(
            context::url, "x", trust::trusted);
        auto const b = make_safe_string(
            context::markup, "x", trust::trusted);
        BOOST_TEST(a == a);
        BOOST_TEST(a != b);
        BOOST_TEST(b == any_safe_string(html_string::from_trusted("x")));

        std::stringstream ss;
        ss << a << b;
        BOOST_TEST_EQ(ss.str(), "xx");
    }

    void
    run()
    {
        test_make();
        test_convert();
        test_append();
        test_as();
        test_compare();
    }
};

TEST_SUITE(
    any_safe_string_test,
    "boost.safestring.any_safe_string");

} // safestring
} // boost
