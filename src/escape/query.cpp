//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#include <boost/safestring/escape/query.hpp>
#include <boost/url/decode_view.hpp>
#include <boost/url/encode.hpp>
#include <boost/url/encoding_opts.hpp>
#include <boost/url/pct_string_view.hpp>
#include <boost/url/rfc/unreserved_chars.hpp>

namespace boost {
namespace safestring {

std::string
escape_query_argument(
    core::string_view s,
    query_config const& cfg)
{
    urls::encoding_opts opt;
    opt.space_as_plus = cfg.space_as_plus;
    return urls::encode(
        s, urls::unreserved_chars, opt);
}

system::result<std::string>
unescape_query_argument(
    core::string_view s)
{
    auto rv = urls::make_pct_string_view(s);
    if(rv.has_error())
        BOOST_SAFESTRING_RETURN_EC(
            error::malformed_encoding);

    urls::encoding_opts opt;
    opt.space_as_plus = true;
    urls::decode_view dv(*rv, opt);
    return std::string(dv.begin(), dv.end());
}

} // safestring
} // boost
