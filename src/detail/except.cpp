//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#include <boost/safestring/detail/except.hpp>
#include <boost/throw_exception.hpp>
#include <stdexcept>

namespace boost {
namespace safestring {
namespace detail {

void
throw_invalid_argument(
    char const* what,
    source_location const& loc)
{
    throw_exception(
        std::invalid_argument(what),
        loc);
}

} // detail
} // safestring
} // boost
