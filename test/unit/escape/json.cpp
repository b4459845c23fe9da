//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

// Test that header file is self-contained.
#include <boost/safestring/escape/json.hpp>

#include "test_helpers.hpp"

namespace boost {
namespace safestring {

struct json_test
{
    void
    test_escape()
    {
        BOOST_TEST_EQ(escape_json(""), "\"\"");
        BOOST_TEST_EQ(escape_json("x"), "\"x\"");
        BOOST_TEST_EQ(
            escape_json("say \"hi\"\n"),
            "\"say \\\"hi\\\"\\n\"");
        BOOST_TEST_EQ(escape_json("a\\b"), "\"a\\\\b\"");
        BOOST_TEST_EQ(escape_json("tab\t"), "\"tab\\t\"");
    }

    void
    test_unescape()
    {
        check_ok(unescape_json("\"x\""), "x");
        check_ok(unescape_json("\"\""), "");
        check_ok(unescape_json("\"a\\tb\""), "a\tb");
        check_ok(unescape_json("\"\\u00e9\""), "\xc3\xa9");
        check_ok(unescape_json("\"\\/\""), "/");
        check_ok(unescape_json(" \"x\" "), "x");

        // malformed
        check_err(unescape_json(""), error::malformed_encoding);
        check_err(unescape_json("x"), error::malformed_encoding);
        check_err(unescape_json("\"open"), error::malformed_encoding);
        check_err(unescape_json("\"a\" \"b\""), error::malformed_encoding);
        check_err(unescape_json("\"\\q\""), error::malformed_encoding);

        // not text
        check_err(unescape_json("42"), error::type_mismatch);
        check_err(unescape_json("null"), error::type_mismatch);
        check_err(unescape_json("true"), error::type_mismatch);
        check_err(unescape_json("[\"x\"]"), error::type_mismatch);
        check_err(unescape_json("{\"a\":\"x\"}"), error::type_mismatch);
    }

    void
    test_round_trip()
    {
        char const* const v[] = {
            "",
            "plain",
            "quote \" and backslash \\",
            "tab\tnewline\ncr\r",
            "\x01\x1f control",
            "</script>",
            "caf\xc3\xa9"
        };
        for(auto s : v)
            check_ok(unescape_json(escape_json(s)), s);
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
    json_test,
    "boost.safestring.escape.json");

} // safestring
} // boost
