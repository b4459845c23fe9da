//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#ifndef BOOST_SAFESTRING_ESCAPE_EMAIL_HPP
#define BOOST_SAFESTRING_ESCAPE_EMAIL_HPP

#include <boost/safestring/detail/config.hpp>
#include <boost/safestring/error.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <string>

namespace boost {
namespace safestring {

/** Extract one email address from text.

    Returns the leftmost substring matching

    @code
    address = 1*local "@" 1*domain "." 2*4ALPHA
    local   = ALPHA / DIGIT / "." / "_" / "%" / "+" / "-"
    domain  = ALPHA / DIGIT / "." / "-"
    @endcode

    The domain part is as long as possible, then the
    final label is as long as possible. Everything
    else in the input is discarded, which prevents
    extra recipients or headers from being smuggled
    into an email header.

    @par Example
    @code
    auto rv = escape_email_address( "To: evil@x.com\nBcc: a@b.com" );
    // *rv == "evil@x.com"
    @endcode

    @param s The text to search.

    @return The address, or @ref error::no_address_found.
*/
BOOST_SAFESTRING_DECL
system::result<std::string>
escape_email_address(core::string_view s);

/** Return an email address unchanged.

    The discarded text cannot be recovered, so
    there is no inverse.

    @param s The address.

    @return A copy of `s`.
*/
BOOST_SAFESTRING_DECL
std::string
unescape_email_address(core::string_view s);

} // safestring
} // boost

#endif
