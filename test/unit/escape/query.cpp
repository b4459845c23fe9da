//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

// Test that header file is self-contained.
#include <boost/safestring/escape/query.hpp>

#include "test_helpers.hpp"

namespace boost {
namespace safestring {

struct query_test
{
    void
    test_escape()
    {
        BOOST_TEST_EQ(escape_query_argument(""), "");
        BOOST_TEST_EQ(escape_query_argument("abc-_.~XYZ09"), "abc-_.~XYZ09");
        BOOST_TEST_EQ(escape_query_argument("a b&c=d"), "a+b%26c%3Dd");
        BOOST_TEST_EQ(escape_query_argument("1+1"), "1%2B1");
        BOOST_TEST_EQ(escape_query_argument("50%"), "50%25");
        BOOST_TEST_EQ(escape_query_argument("/?#"), "%2F%3F%23");
        BOOST_TEST_EQ(escape_query_argument("caf\xc3\xa9"), "caf%C3%A9");

        query_config cfg;
        cfg.space_as_plus = false;
        BOOST_TEST_EQ(escape_query_argument("a b", cfg), "a%20b");
    }

    void
    test_unescape()
    {
        check_ok(unescape_query_argument(""), "");
        check_ok(unescape_query_argument("a+b%26c%3Dd"), "a b&c=d");
        check_ok(unescape_query_argument("a%20b"), "a b");
        check_ok(unescape_query_argument("1%2B1"), "1+1");
        check_ok(unescape_query_argument("%c3%a9"), "\xc3\xa9");
        check_ok(unescape_query_argument("plain"), "plain");

        check_err(unescape_query_argument("%G1"), error::malformed_encoding);
        check_err(unescape_query_argument("%"), error::malformed_encoding);
        check_err(unescape_query_argument("abc%4"), error::malformed_encoding);
    }

    void
    test_round_trip()
    {
        char const* const v[] = {
            "",
            "a b c",
            "key=value&other=1+2",
            "100% sure",
            "caf\xc3\xa9 cr\xc3\xa8me"
        };
        for(auto s : v)
            check_ok(unescape_query_argument(
                escape_query_argument(s)), s);

        query_config cfg;
        cfg.space_as_plus = false;
        for(auto s : v)
            check_ok(unescape_query_argument(
                escape_query_argument(s, cfg)), s);
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
    query_test,
    "boost.safestring.escape.query");

} // safestring
} // boost
