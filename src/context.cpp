//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#include <boost/safestring/context.hpp>
#include <ostream>

namespace boost {
namespace safestring {

core::string_view
to_string(context c) noexcept
{
    switch(c)
    {
    case context::markup: return "markup";
    case context::structured_data: return "structured-data";
    case context::url: return "url";
    case context::query_argument: return "query-argument";
    case context::email_address: return "email-address";
    case context::parameterized_text: return "parameterized-text";
    default:
        return "unknown";
    }
}

std::ostream&
operator<<(
    std::ostream& os,
    context c)
{
    os << to_string(c);
    return os;
}

} // safestring
} // boost
