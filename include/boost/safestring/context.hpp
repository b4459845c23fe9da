//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#ifndef BOOST_SAFESTRING_CONTEXT_HPP
#define BOOST_SAFESTRING_CONTEXT_HPP

#include <boost/safestring/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <iosfwd>

namespace boost {
namespace safestring {

/** An output context.

    Each context owns exactly one escape algorithm
    and one unescape algorithm. A string tagged with
    a context may be emitted into that context
    without further processing.

    @see
        @ref escape_for,
        @ref unescape_for,
        @ref basic_safe_string.
*/
enum class context
{
    /// HTML text and attribute values
    markup,

    /// A JSON string literal, quotes included
    structured_data,

    /// A complete URL, for example a Location header
    url,

    /// A single argument of a URL query
    query_argument,

    /// A single email address
    email_address,

    /// Text built from a template with quoted values
    parameterized_text
};

/** Return the name of a context.

    @return The lower-case name, or `"unknown"` for
    a value which is not part of the enumeration.
*/
BOOST_SAFESTRING_DECL
core::string_view
to_string(context c) noexcept;

/** Format the name of a context to an output stream.
*/
BOOST_SAFESTRING_DECL
std::ostream&
operator<<(
    std::ostream& os,
    context c);

namespace detail {

inline
constexpr
bool
is_known(context c) noexcept
{
    return
        c == context::markup ||
        c == context::structured_data ||
        c == context::url ||
        c == context::query_argument ||
        c == context::email_address ||
        c == context::parameterized_text;
}

} // detail

} // safestring
} // boost

#endif
