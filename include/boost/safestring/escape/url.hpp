//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#ifndef BOOST_SAFESTRING_ESCAPE_URL_HPP
#define BOOST_SAFESTRING_ESCAPE_URL_HPP

#include <boost/safestring/detail/config.hpp>
#include <boost/safestring/config.hpp>
#include <boost/safestring/error.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <string>

namespace boost {
namespace safestring {

/** Make a URL safe for use in HTTP headers and links.

    The input is processed as follows:

    @li Everything from the first carriage return or
        line feed onwards is dropped. This defeats
        header injection through an embedded newline.
    @li Leading and trailing whitespace and control
        characters are removed, as are embedded tabs.
    @li Characters which may not appear in a URL are
        percent-encoded. Reserved characters and valid
        percent-escapes are kept.
    @li The result is parsed as a URI-reference and,
        when `cfg.normalize` is set, normalized.

    @par Example
    @code
    auto rv = escape_url( "HTTP://Example.com/a b\nSet-Cookie: x" );
    // *rv == "http://example.com/a%20b"
    @endcode

    @param s The URL to escape.

    @param cfg The settings to use.

    @return The URL, or @ref error::malformed_encoding
    if no URI-reference can be formed from the input.

    @see
        @ref unescape_url,
        <a href="https://www.rfc-editor.org/rfc/rfc3986#section-2"
        >2. Characters (rfc3986)</a>.
*/
BOOST_SAFESTRING_DECL
system::result<std::string>
escape_url(
    core::string_view s,
    url_config const& cfg = {});

/** Return a URL unchanged.

    Escaping a URL drops structure which cannot be
    reconstructed, so there is no inverse. The
    returned string is the escaped URL itself and
    not the text it was created from.

    @param s The escaped URL.

    @return A copy of `s`.
*/
BOOST_SAFESTRING_DECL
std::string
unescape_url(core::string_view s);

} // safestring
} // boost

#endif
