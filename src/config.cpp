//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#include <boost/safestring/config.hpp>
#include <boost/safestring/detail/except.hpp>

namespace boost {
namespace safestring {

void
validate(sql_config const& cfg)
{
    if( cfg.quote != '\'' &&
        cfg.quote != '"')
        detail::throw_invalid_argument(
            "sql_config::quote must be a quote character");
}

void
validate(escape_config const& cfg)
{
    validate(cfg.sql);
}

} // safestring
} // boost
