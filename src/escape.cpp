//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#include <boost/safestring/escape.hpp>
#include <boost/safestring/escape/email.hpp>
#include <boost/safestring/escape/html.hpp>
#include <boost/safestring/escape/json.hpp>
#include <boost/safestring/escape/query.hpp>
#include <boost/safestring/escape/sql.hpp>
#include <boost/safestring/escape/url.hpp>

namespace boost {
namespace safestring {

system::result<std::string>
escape_for(
    context c,
    core::string_view data,
    escape_config const& cfg)
{
    validate(cfg);
    switch(c)
    {
    case context::markup:
        return escape_html(data);
    case context::structured_data:
        return escape_json(data);
    case context::url:
        return escape_url(data, cfg.url);
    case context::query_argument:
        return escape_query_argument(data, cfg.query);
    case context::email_address:
        return escape_email_address(data);
    case context::parameterized_text:
        return quote_sql_value(data, cfg.sql);
    default:
        break;
    }
    BOOST_SAFESTRING_RETURN_EC(
        error::unimplemented_context);
}

system::result<std::string>
unescape_for(
    context c,
    core::string_view text)
{
    switch(c)
    {
    case context::markup:
        return unescape_html(text);
    case context::structured_data:
        return unescape_json(text);
    case context::url:
        return unescape_url(text);
    case context::query_argument:
        return unescape_query_argument(text);
    case context::email_address:
        return unescape_email_address(text);
    case context::parameterized_text:
        BOOST_SAFESTRING_RETURN_EC(
            error::not_reversible);
    default:
        break;
    }
    BOOST_SAFESTRING_RETURN_EC(
        error::unimplemented_context);
}

system::result<std::string>
upgrade(
    context to,
    context from,
    core::string_view text)
{
    if( ! detail::is_known(to) ||
        ! detail::is_known(from))
        BOOST_SAFESTRING_RETURN_EC(
            error::unimplemented_context);

    // already safe for the target
    if(to == from)
        return std::string(text.data(), text.size());

    auto data = unescape_for(from, text);
    if(data.has_error())
        return data.error();
    return escape_for(to, *data);
}

} // safestring
} // boost
