//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#ifndef BOOST_SAFESTRING_ESCAPE_JSON_HPP
#define BOOST_SAFESTRING_ESCAPE_JSON_HPP

#include <boost/safestring/detail/config.hpp>
#include <boost/safestring/error.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <string>

namespace boost {
namespace safestring {

/** Serialize text as a JSON string literal.

    The result includes the enclosing double quotes.
    Quotes, backslashes and control characters are
    escaped as required by RFC 8259.

    @par Example
    @code
    std::string s = escape_json( "say \"hi\"\n" );
    // s == "\"say \\\"hi\\\"\\n\""
    @endcode

    @param s The text to serialize.

    @return A JSON string literal.

    @see @ref unescape_json.
*/
BOOST_SAFESTRING_DECL
std::string
escape_json(core::string_view s);

/** Parse a JSON string literal.

    @par Example
    @code
    auto rv = unescape_json( "\"a\\tb\"" );
    assert( rv.has_value() && *rv == "a\tb" );
    @endcode

    @param s The JSON text, which must hold exactly
    one string literal. Surrounding whitespace is
    permitted.

    @return The text, or an error:
    @li @ref error::malformed_encoding if `s` is not
        valid JSON,
    @li @ref error::type_mismatch if `s` is valid JSON
        but not a string.
*/
BOOST_SAFESTRING_DECL
system::result<std::string>
unescape_json(core::string_view s);

} // safestring
} // boost

#endif
