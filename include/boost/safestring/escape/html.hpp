//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#ifndef BOOST_SAFESTRING_ESCAPE_HTML_HPP
#define BOOST_SAFESTRING_ESCAPE_HTML_HPP

#include <boost/safestring/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <string>

namespace boost {
namespace safestring {

/** Escape a string for safe inclusion in HTML.

    Replaces characters that have special meaning in HTML
    with their corresponding character entity references:

    @li `&` becomes `&amp;`
    @li `<` becomes `&lt;`
    @li `>` becomes `&gt;`
    @li `"` becomes `&quot;`
    @li `'` becomes `&#39;`

    The output is safe in element content and in quoted
    attribute values. Escaping text which was already
    escaped encodes it twice.

    @par Example
    @code
    std::string safe = escape_html( "<script>alert('xss')</script>" );
    // safe == "&lt;script&gt;alert(&#39;xss&#39;)&lt;/script&gt;"
    @endcode

    @param s The string to escape.

    @return A new string with HTML special characters escaped.

    @see @ref unescape_html.
*/
BOOST_SAFESTRING_DECL
std::string
escape_html(core::string_view s);

/** Decode HTML character references.

    Decodes named references such as `&amp;` and
    `&nbsp;`, decimal references such as `&#39;` and
    hexadecimal references such as `&#x27;`. Numeric
    references are written as UTF-8; a reference to
    zero, to a surrogate or beyond U+10FFFF becomes
    U+FFFD.

    An ampersand which does not start a recognized
    reference terminated by a semicolon is copied
    unchanged, so the function never fails.

    @par Postconditions
    @code
    unescape_html( escape_html( s ) ) == s
    @endcode

    @param s The string to decode.

    @return The decoded string.
*/
BOOST_SAFESTRING_DECL
std::string
unescape_html(core::string_view s);

} // safestring
} // boost

#endif
