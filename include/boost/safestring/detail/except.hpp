//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#ifndef BOOST_SAFESTRING_DETAIL_EXCEPT_HPP
#define BOOST_SAFESTRING_DETAIL_EXCEPT_HPP

#include <boost/safestring/detail/config.hpp>
#include <boost/assert/source_location.hpp>

namespace boost {
namespace safestring {
namespace detail {

BOOST_SAFESTRING_DECL void BOOST_NORETURN throw_invalid_argument(
    char const* what,
    source_location const& loc = BOOST_CURRENT_LOCATION);

} // detail
} // safestring
} // boost

#endif
