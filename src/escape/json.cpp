//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#include <boost/safestring/escape/json.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>

namespace boost {
namespace safestring {

std::string
escape_json(core::string_view s)
{
    return json::serialize(
        json::string_view(s.data(), s.size()));
}

system::result<std::string>
unescape_json(core::string_view s)
{
    system::error_code ec;
    json::value v = json::parse(
        json::string_view(s.data(), s.size()), ec);
    if(ec.failed())
        BOOST_SAFESTRING_RETURN_EC(
            error::malformed_encoding);
    if(! v.is_string())
        BOOST_SAFESTRING_RETURN_EC(
            error::type_mismatch);
    json::string const& js = v.get_string();
    return std::string(js.data(), js.size());
}

} // safestring
} // boost
