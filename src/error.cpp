//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#include <boost/safestring/error.hpp>

namespace boost {
namespace safestring {
namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "boost.safestring";
}

std::string
error_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
error_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::ok: return "success";
    case error::unimplemented_context: return "unimplemented context";
    case error::type_mismatch: return "type mismatch";
    case error::placeholder_count_mismatch: return "placeholder count mismatch";
    case error::no_address_found: return "no address found";
    case error::malformed_encoding: return "malformed encoding";
    case error::not_reversible: return "not reversible";
    case error::bad_format_string: return "bad format string";
    case error::missing_argument: return "missing argument";
    default:
        return "unknown";
    }
}

//-----------------------------------------------

const char*
condition_cat_type::
name() const noexcept
{
    return "boost.safestring.condition";
}

std::string
condition_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
condition_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<condition>(ev))
    {
    case condition::invalid_input: return "invalid input";
    case condition::unsupported_operation: return "unsupported operation";
    default:
        return "unknown";
    }
}

bool
condition_cat_type::
equivalent(
    system::error_code const& ec,
    int ev) const noexcept
{
    if(ec.category() != error_cat)
        return false;
    switch(static_cast<condition>(ev))
    {
    case condition::invalid_input:
        switch(static_cast<error>(ec.value()))
        {
        case error::type_mismatch:
        case error::placeholder_count_mismatch:
        case error::no_address_found:
        case error::malformed_encoding:
        case error::bad_format_string:
        case error::missing_argument:
            return true;
        default:
            return false;
        }

    case condition::unsupported_operation:
        return
            ec == error::unimplemented_context ||
            ec == error::not_reversible;

    default:
        return false;
    }
}

//-----------------------------------------------

// msvc 14.0 has a bug that warns about inability
// to use constexpr construction here, even though
// there's no constexpr construction
#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( push )
# pragma warning( disable : 4592 )
#endif

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
constinit condition_cat_type condition_cat;
#else
error_cat_type error_cat;
condition_cat_type condition_cat;
#endif

#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( pop )
#endif

} // detail
} // safestring
} // boost
