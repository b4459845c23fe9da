//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

// Test that header file is self-contained.
#include <boost/safestring/escape/html.hpp>

#include "test_suite.hpp"

namespace boost {
namespace safestring {

struct html_test
{
    void
    test_escape()
    {
        BOOST_TEST_EQ(escape_html(""), "");
        BOOST_TEST_EQ(escape_html("plain text"), "plain text");
        BOOST_TEST_EQ(escape_html("a & b"), "a &amp; b");
        BOOST_TEST_EQ(escape_html("<b>"), "&lt;b&gt;");
        BOOST_TEST_EQ(escape_html("\"q\""), "&quot;q&quot;");
        BOOST_TEST_EQ(escape_html("it's"), "it&#39;s");
        BOOST_TEST_EQ(
            escape_html("<script>alert('xss')</script>"),
            "&lt;script&gt;alert(&#39;xss&#39;)&lt;/script&gt;");

        // escaped text is escaped again
        BOOST_TEST_EQ(escape_html("&amp;"), "&amp;amp;");

        // bytes above 0x7f pass through
        BOOST_TEST_EQ(escape_html("caf\xc3\xa9"), "caf\xc3\xa9");
    }

    void
    test_unescape()
    {
        BOOST_TEST_EQ(unescape_html(""), "");
        BOOST_TEST_EQ(unescape_html("&lt;b&gt;"), "<b>");
        BOOST_TEST_EQ(unescape_html("&quot;&amp;&apos;"), "\"&'");
        BOOST_TEST_EQ(unescape_html("&amp;amp;"), "&amp;");

        // numeric references
        BOOST_TEST_EQ(unescape_html("&#39;"), "'");
        BOOST_TEST_EQ(unescape_html("&#x27;"), "'");
        BOOST_TEST_EQ(unescape_html("&#X41;"), "A");
        BOOST_TEST_EQ(unescape_html("&#233;"), "\xc3\xa9");
        BOOST_TEST_EQ(unescape_html("&#x20AC;"), "\xe2\x82\xac");
        BOOST_TEST_EQ(unescape_html("&#x1F600;"), "\xf0\x9f\x98\x80");

        // named references beyond the escaped five
        BOOST_TEST_EQ(unescape_html("&nbsp;"), "\xc2\xa0");
        BOOST_TEST_EQ(unescape_html("&copy; 2025"), "\xc2\xa9 2025");
        BOOST_TEST_EQ(unescape_html("&euro;"), "\xe2\x82\xac");
        BOOST_TEST_EQ(unescape_html("caf&eacute;"), "caf\xc3\xa9");
        BOOST_TEST_EQ(unescape_html("&hearts;"), "\xe2\x99\xa5");
        BOOST_TEST_EQ(unescape_html("&Auml;"), "\xc3\x84");
        BOOST_TEST_EQ(unescape_html("&AMP;"), "&");
        BOOST_TEST_EQ(
            unescape_html("&NotEqualTilde;"),
            "\xe2\x89\x82\xcc\xb8");

        // legacy names without the semicolon
        BOOST_TEST_EQ(unescape_html("&lt"), "<");
        BOOST_TEST_EQ(unescape_html("&amp"), "&");
        BOOST_TEST_EQ(unescape_html("&ampx"), "&x");
        BOOST_TEST_EQ(unescape_html("&eacute"), "\xc3\xa9");
        BOOST_TEST_EQ(unescape_html("&notit;"), "\xc2\xacit;");

        // numeric references without the semicolon
        BOOST_TEST_EQ(unescape_html("&#65"), "A");
        BOOST_TEST_EQ(unescape_html("&#x41"), "A");
        BOOST_TEST_EQ(unescape_html("&#65x"), "Ax");

        // 0x80 to 0x9f are read as Windows-1252
        BOOST_TEST_EQ(unescape_html("&#150;"), "\xe2\x80\x93");
        BOOST_TEST_EQ(unescape_html("&#x80;"), "\xe2\x82\xac");
        BOOST_TEST_EQ(unescape_html("&#x81;"), "\xc2\x81");

        // controls and noncharacters produce nothing
        BOOST_TEST_EQ(unescape_html("a&#1;b"), "ab");
        BOOST_TEST_EQ(unescape_html("a&#xFFFF;b"), "ab");
        BOOST_TEST_EQ(unescape_html("&#xFDD0;"), "");
        BOOST_TEST_EQ(unescape_html("&#13;"), "\r");

        // invalid code points
        BOOST_TEST_EQ(unescape_html("&#0;"), "\xef\xbf\xbd");
        BOOST_TEST_EQ(unescape_html("&#xD800;"), "\xef\xbf\xbd");
        BOOST_TEST_EQ(unescape_html("&#99999999;"), "\xef\xbf\xbd");

        // not references
        BOOST_TEST_EQ(unescape_html("AT&T"), "AT&T");
        BOOST_TEST_EQ(unescape_html("&unknown;"), "&unknown;");
        BOOST_TEST_EQ(unescape_html("&#;"), "&#;");
        BOOST_TEST_EQ(unescape_html("&#x;"), "&#x;");
        BOOST_TEST_EQ(unescape_html("&#xZZ;"), "&#xZZ;");
        BOOST_TEST_EQ(unescape_html("&;"), "&;");
        BOOST_TEST_EQ(unescape_html("a&&lt;"), "a&<");
    }

    void
    test_round_trip()
    {
        char const* const v[] = {
            "",
            "plain",
            "<>&\"'",
            "&amp; already escaped",
            "<a href='x?a=1&b=2'>&copy;</a>",
            "caf\xc3\xa9 & cr\xc3\xa8me"
        };
        for(auto s : v)
            BOOST_TEST_EQ(unescape_html(escape_html(s)), s);
    }

    void
    run()
    {
        test_escape();
        test_unescape();
        test_round_trip();
    }
};

TEST_SUITE(
    html_test,
    "boost.safestring.escape.html");

} // safestring
} // boost
