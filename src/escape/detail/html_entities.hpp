//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#ifndef BOOST_SAFESTRING_ESCAPE_DETAIL_HTML_ENTITIES_HPP
#define BOOST_SAFESTRING_ESCAPE_DETAIL_HTML_ENTITIES_HPP

#include <boost/safestring/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>

namespace boost {
namespace safestring {
namespace detail {

struct html_entity
{
    core::string_view name;
    core::string_view value;
};

/** Return a named character reference.

    @param name The name, with its trailing
    semicolon if it has one.

    @return The entry, or `nullptr` if `name`
    is not a reference.
*/
html_entity const*
find_html_entity( core::string_view name ) noexcept;

} // detail
} // safestring
} // boost

#endif
