//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#ifndef BOOST_SAFESTRING_ESCAPE_HPP
#define BOOST_SAFESTRING_ESCAPE_HPP

#include <boost/safestring/detail/config.hpp>
#include <boost/safestring/config.hpp>
#include <boost/safestring/context.hpp>
#include <boost/safestring/error.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <string>

namespace boost {
namespace safestring {

/** Escape untrusted data for a context.

    This gives direct access to the escape algorithm
    of one context, for callers which need escaped
    text without constructing a safe string.

    @li @ref context::markup uses @ref escape_html
    @li @ref context::structured_data uses @ref escape_json
    @li @ref context::url uses @ref escape_url
    @li @ref context::query_argument uses
        @ref escape_query_argument
    @li @ref context::email_address uses
        @ref escape_email_address
    @li @ref context::parameterized_text uses
        @ref quote_sql_value; a single value becomes
        one quoted literal

    @par Example
    @code
    auto rv = escape_for( context::markup, "a<b" );
    // *rv == "a&lt;b"
    @endcode

    @throw std::invalid_argument `cfg` is invalid.

    @param c The target context.

    @param data The untrusted data.

    @param cfg The settings to use.

    @return The escaped text, the error reported by
    the context, or @ref error::unimplemented_context
    if `c` is not a known context.
*/
BOOST_SAFESTRING_DECL
system::result<std::string>
escape_for(
    context c,
    core::string_view data,
    escape_config const& cfg = {});

/** Recover the data from text escaped for a context.

    @li @ref context::url and
        @ref context::email_address return the text
        unchanged, their escaping cannot be undone
    @li @ref context::parameterized_text has no
        inverse and fails with
        @ref error::not_reversible

    @param c The context `text` was escaped for.

    @param text The escaped text.

    @return The data, the error reported by the
    context, or @ref error::unimplemented_context if
    `c` is not a known context.
*/
BOOST_SAFESTRING_DECL
system::result<std::string>
unescape_for(
    context c,
    core::string_view text);

/** Convert text from one context to another.

    If `from == to` the text is returned unchanged,
    since it is already safe for `to`. Otherwise the
    text is unescaped for `from` and the result is
    escaped for `to`. Safety is never carried across
    contexts.

    @param to The target context.

    @param from The context `text` is safe for.

    @param text The escaped text.

    @return The text escaped for `to`, or the first
    error encountered.
*/
BOOST_SAFESTRING_DECL
system::result<std::string>
upgrade(
    context to,
    context from,
    core::string_view text);

} // safestring
} // boost

#endif
