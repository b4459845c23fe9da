//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

// Test that header file is self-contained.
#include <boost/safestring/escape/url.hpp>

#include "test_helpers.hpp"

namespace boost {
namespace safestring {

struct url_test
{
    static
    system::result<std::string>
    raw(core::string_view s)
    {
        url_config cfg;
        cfg.normalize = false;
        return escape_url(s, cfg);
    }

    void
    test_escape()
    {
        check_ok(escape_url("http://example.com/"), "http://example.com/");
        check_ok(escape_url(""), "");
        check_ok(escape_url("/relative/path?q=1#top"), "/relative/path?q=1#top");

        // header injection
        check_ok(
            escape_url("http://host/path\nInjected-Header: x"),
            "http://host/path");
        check_ok(
            escape_url("http://host/path\r\nSet-Cookie: a=b"),
            "http://host/path");

        // surrounding blanks and embedded tabs
        check_ok(escape_url("  http://host/\x7f "), "http://host/");
        check_ok(escape_url("http://ho\tst/"), "http://host/");

        // unsafe characters are encoded
        check_ok(raw("http://example.com/a b"), "http://example.com/a%20b");
        check_ok(raw("http://example.com/<x>"), "http://example.com/%3Cx%3E");
        check_ok(raw("http://example.com/\"q\""), "http://example.com/%22q%22");
        check_ok(raw("/caf\xc3\xa9"), "/caf%C3%A9");

        // valid escapes are kept, stray percents encoded
        check_ok(raw("/%41%zz"), "/%41%25zz");
        check_ok(raw("/100%"), "/100%25");

        // not a URI reference after encoding
        check_err(escape_url("http://[::1/x"), error::malformed_encoding);
        check_err(escape_url("http://host:port/"), error::malformed_encoding);
    }

    void
    test_delimiters()
    {
        // only the first '#' starts the fragment
        check_ok(escape_url("http://example.com/#a#b"), "http://example.com/#a%23b");
        check_ok(raw("/p#x#y#"), "/p#x%23y%23");
        check_ok(raw("#"), "#");

        // brackets outside an IP literal host
        check_ok(escape_url("http://host/?a[]=1"), "http://host/?a%5B%5D=1");
        check_ok(raw("/a]b[c"), "/a%5Db%5Bc");
        check_ok(raw("http://host/#[x]"), "http://host/#%5Bx%5D");
        check_ok(raw("/[::1]/x"), "/%5B::1%5D/x");

        // brackets of an IP literal host are kept
        check_ok(
            escape_url("http://[::1]:8080/p?q[0]=1"),
            "http://[::1]:8080/p?q%5B0%5D=1");
        check_ok(
            raw("http://user@[2001:db8::1]/"),
            "http://user@[2001:db8::1]/");
        check_ok(raw("//[::1]/"), "//[::1]/");
    }

    void
    test_normalize()
    {
        check_ok(escape_url("HTTP://example.com/"), "http://example.com/");
        check_ok(escape_url("http://EXAMPLE.com/"), "http://example.com/");
        check_ok(
            escape_url("http://example.com/a/./b/../c"),
            "http://example.com/a/c");
        check_ok(escape_url("/%41%7e"), "/A~");
        check_ok(escape_url("/%3c"), "/%3C");

        // left alone when disabled
        check_ok(raw("HTTP://example.com/a/./b"), "HTTP://example.com/a/./b");
    }

    void
    test_unescape()
    {
        BOOST_TEST_EQ(unescape_url(""), "");
        BOOST_TEST_EQ(unescape_url("/a%20b"), "/a%20b");
        BOOST_TEST_EQ(
            unescape_url("http://example.com/?q=%3C"),
            "http://example.com/?q=%3C");
    }

    void
    run()
    {
        test_escape();
        test_delimiters();
        test_normalize();
        test_unescape();
    }
};

TEST_SUITE(
    url_test,
    "boost.safestring.escape.url");

} // safestring
} // boost
