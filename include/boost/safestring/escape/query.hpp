//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#ifndef BOOST_SAFESTRING_ESCAPE_QUERY_HPP
#define BOOST_SAFESTRING_ESCAPE_QUERY_HPP

#include <boost/safestring/detail/config.hpp>
#include <boost/safestring/config.hpp>
#include <boost/safestring/error.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <string>

namespace boost {
namespace safestring {

/** Percent-encode a single query argument.

    Every character except the unreserved set
    `A-Z a-z 0-9 - . _ ~` is percent-encoded using
    upper-case hexadecimal digits. The result may be
    used as a key or a value in a query string.

    @par Example
    @code
    std::string s = escape_query_argument( "a b&c=d" );
    // s == "a+b%26c%3Dd"
    @endcode

    @param s The text to encode.

    @param cfg The settings to use. When
    `cfg.space_as_plus` is false a space becomes `%20`.

    @return The encoded argument.

    @see @ref unescape_query_argument.
*/
BOOST_SAFESTRING_DECL
std::string
escape_query_argument(
    core::string_view s,
    query_config const& cfg = {});

/** Decode a single query argument.

    Percent-escapes are decoded and `+` becomes a
    space.

    @param s The encoded argument.

    @return The decoded text, or
    @ref error::malformed_encoding if `s` contains a
    `%` which is not followed by two hexadecimal
    digits.
*/
BOOST_SAFESTRING_DECL
system::result<std::string>
unescape_query_argument(core::string_view s);

} // safestring
} // boost

#endif
