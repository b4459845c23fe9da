//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#ifndef BOOST_SAFESTRING_CONFIG_HPP
#define BOOST_SAFESTRING_CONFIG_HPP

#include <boost/safestring/detail/config.hpp>

namespace boost {
namespace safestring {

/** Query argument escaping settings.

    @see @ref escape_query_argument.
*/
struct query_config
{
    /** Encode a space as `+` instead of `%20`.

        Decoding always accepts both.
    */
    bool space_as_plus = true;
};

/** URL escaping settings.

    @see @ref escape_url.
*/
struct url_config
{
    /** Normalize the URL after validation.

        Normalization lower-cases the scheme and host,
        makes percent-encoding canonical and removes
        dot segments from the path.
    */
    bool normalize = true;
};

/** Parameterized text settings.

    @see @ref quote_sql_value, @ref format_sql.
*/
struct sql_config
{
    /** Delimiter wrapped around each value.

        Must be a single quote or a double quote.
    */
    char quote = '\'';
};

/** Settings for every context.

    A default-constructed object is the configuration
    used by the safe string types. The settings only
    change the output of direct calls to @ref escape_for
    and the per-context functions.

    @see
        @ref escape_for,
        @ref validate.
*/
struct escape_config
{
    /// Settings for @ref context::query_argument.
    query_config query;

    /// Settings for @ref context::url.
    url_config url;

    /// Settings for @ref context::parameterized_text.
    sql_config sql;
};

/** Check a configuration.

    @throw std::invalid_argument
    `cfg.sql.quote` is neither `'` nor `"`.

    @param cfg The settings to check.
*/
BOOST_SAFESTRING_DECL
void
validate(escape_config const& cfg);

/** Check parameterized text settings.

    @throw std::invalid_argument
    `cfg.quote` is neither `'` nor `"`.
*/
BOOST_SAFESTRING_DECL
void
validate(sql_config const& cfg);

} // safestring
} // boost

#endif
