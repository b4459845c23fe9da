//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

// Test that header file is self-contained.
#include <boost/safestring/context.hpp>

#include "test_suite.hpp"

#include <sstream>

namespace boost {
namespace safestring {

struct context_test
{
    void
    test_to_string()
    {
        BOOST_TEST_EQ(to_string(context::markup), "markup");
        BOOST_TEST_EQ(to_string(context::structured_data), "structured-data");
        BOOST_TEST_EQ(to_string(context::url), "url");
        BOOST_TEST_EQ(to_string(context::query_argument), "query-argument");
        BOOST_TEST_EQ(to_string(context::email_address), "email-address");
        BOOST_TEST_EQ(to_string(context::parameterized_text), "parameterized-text");
        BOOST_TEST_EQ(to_string(static_cast<context>(99)), "unknown");
    }

    void
    test_ostream()
    {
        std::stringstream ss;
        ss << context::query_argument << ' ' << context::url;
        BOOST_TEST_EQ(ss.str(), "query-argument url");
    }

    void
    test_is_known()
    {
        static_assert(detail::is_known(context::markup), "");
        static_assert(detail::is_known(context::parameterized_text), "");
        static_assert(! detail::is_known(static_cast<context>(-1)), "");
        BOOST_TEST(! detail::is_known(static_cast<context>(6)));
    }

    void
    run()
    {
        test_to_string();
        test_ostream();
        test_is_known();
    }
};

TEST_SUITE(
    context_test,
    "boost.safestring.context");

} // safestring
} // boost
