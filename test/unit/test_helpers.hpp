//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#ifndef BOOST_SAFESTRING_TEST_HELPERS_HPP
#define BOOST_SAFESTRING_TEST_HELPERS_HPP

#include <boost/safestring/error.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <string>

#include "test_suite.hpp"

namespace boost {
namespace safestring {

// rv holds the expected text
inline
void
check_ok(
    system::result<std::string> const& rv,
    core::string_view expected)
{
    if(! BOOST_TEST(rv.has_value()))
    {
        BOOST_LIGHTWEIGHT_TEST_OSTREAM
            << "  error: " << rv.error().message()
            << std::endl;
        return;
    }
    BOOST_TEST_EQ(*rv, expected);
}

// rv holds the expected error
template<class T>
void
check_err(
    system::result<T> const& rv,
    error expected)
{
    if(! BOOST_TEST(rv.has_error()))
        return;
    BOOST_TEST(rv.error() == expected);
}

} // safestring
} // boost

#endif
