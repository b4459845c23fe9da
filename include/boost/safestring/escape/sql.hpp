//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#ifndef BOOST_SAFESTRING_ESCAPE_SQL_HPP
#define BOOST_SAFESTRING_ESCAPE_SQL_HPP

#include <boost/safestring/detail/config.hpp>
#include <boost/safestring/config.hpp>
#include <boost/safestring/error.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <initializer_list>
#include <string>
#include <vector>

namespace boost {
namespace safestring {

/** Quote one value for parameterized text.

    The value is neutralized and wrapped in
    `cfg.quote`:

    @li `\` becomes `\\`
    @li `'` becomes `\'`
    @li `"` becomes `\"`
    @li `/` becomes `\/`
    @li line feed, carriage return, tab and NUL
        are removed

    @par Example
    @code
    std::string s = quote_sql_value( "O'Brien" );
    // s == "'O\\'Brien'"
    @endcode

    @note This is a textual mitigation only. It is
    not a parameter binding protocol and does not
    defend against encoding specific attacks such as
    multi-byte sequences which swallow a backslash.
    Use the prepared statements of the database
    client to pass untrusted data to a database.

    @throw std::invalid_argument `cfg` is invalid.

    @param v The value.

    @param cfg The settings to use.

    @return The quoted value.
*/
BOOST_SAFESTRING_DECL
std::string
quote_sql_value(
    core::string_view v,
    sql_config const& cfg = {});

/** Substitute quoted values into a template.

    The template is scanned once for `%s` markers.
    A `%%` sequence stands for a literal `%` and is
    not a marker. Each marker is replaced by the
    value at the same position, quoted with
    @ref quote_sql_value.

    @par Example
    @code
    auto rv = format_sql(
        "SELECT * FROM t WHERE name = %s AND id = %s",
        { "O'Brien", "5" } );
    // *rv == "SELECT * FROM t WHERE name = 'O\\'Brien' AND id = '5'"
    @endcode

    @note This is a textual mitigation only, see
    @ref quote_sql_value.

    @throw std::invalid_argument `cfg` is invalid.

    @param tpl The template.

    @param values One value per marker, in order.

    @param cfg The settings to use.

    @return The text, or
    @ref error::placeholder_count_mismatch if the
    number of values differs from the number of
    markers.
*/
BOOST_SAFESTRING_DECL
system::result<std::string>
format_sql(
    core::string_view tpl,
    std::initializer_list<core::string_view> values,
    sql_config const& cfg = {});

/** Substitute quoted values into a template.

    @copydetails format_sql
*/
BOOST_SAFESTRING_DECL
system::result<std::string>
format_sql(
    core::string_view tpl,
    std::vector<std::string> const& values,
    sql_config const& cfg = {});

} // safestring
} // boost

#endif
