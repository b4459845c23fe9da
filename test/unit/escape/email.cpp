//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

// Test that header file is self-contained.
#include <boost/safestring/escape/email.hpp>

#include "test_helpers.hpp"

namespace boost {
namespace safestring {

struct email_test
{
    void
    test_escape()
    {
        check_ok(escape_email_address("user@example.com"), "user@example.com");
        check_ok(
            escape_email_address("First.Last+tag@mail.example.org"),
            "First.Last+tag@mail.example.org");
        check_ok(
            escape_email_address("Contact: <joe_b@host.io>"),
            "joe_b@host.io");

        // header injection, the first address wins
        check_ok(
            escape_email_address(
                "ignore this To: evil@x.com\nBcc: a@b.com real@user.com"),
            "evil@x.com");

        // the match stops at a non-domain character
        check_ok(escape_email_address("a@b.com,c@d.com"), "a@b.com");
        check_ok(escape_email_address("a@b@c.com"), "b@c.com");

        // top level domain takes at most four letters
        check_ok(escape_email_address("user@example.museum"), "user@example.muse");
        check_ok(escape_email_address("user@example.c0m.org"), "user@example.c0m.org");

        check_err(escape_email_address(""), error::no_address_found);
        check_err(escape_email_address("not an address"), error::no_address_found);
        check_err(escape_email_address("a@b"), error::no_address_found);
        check_err(escape_email_address("a@b.c"), error::no_address_found);
        check_err(escape_email_address("@example.com"), error::no_address_found);
        check_err(escape_email_address("a@.com"), error::no_address_found);
    }

    void
    test_unescape()
    {
        BOOST_TEST_EQ(unescape_email_address(""), "");
        BOOST_TEST_EQ(unescape_email_address("user@example.com"), "user@example.com");
    }

    void
    run()
    {
        test_escape();
        test_unescape();
    }
};

TEST_SUITE(
    email_test,
    "boost.safestring.escape.email");

} // safestring
} // boost
