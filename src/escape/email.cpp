//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#include <boost/safestring/escape/email.hpp>
#include <boost/url/grammar/alpha_chars.hpp>
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/lut_chars.hpp>

namespace boost {
namespace safestring {

namespace {

constexpr grammar::lut_chars local_chars(
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789"
    "._%+-");

constexpr grammar::lut_chars domain_chars(
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789"
    ".-");

// Return the length of the longest prefix of
// d matching 1*domain "." 2*4ALPHA, or zero.
// d is a complete run of domain chars.
std::size_t
match_domain(core::string_view d) noexcept
{
    // the name part is greedy, so try the
    // rightmost dot first
    for(std::size_t n = d.size(); n-- > 1;)
    {
        if(d[n] != '.')
            continue;
        std::size_t k = 0;
        while(
            k < 4 &&
            n + 1 + k < d.size() &&
            grammar::alpha_chars(d[n + 1 + k]))
            ++k;
        if(k >= 2)
            return n + 1 + k;
    }
    return 0;
}

} // (anon)

system::result<std::string>
escape_email_address(core::string_view s)
{
    auto const begin = s.data();
    auto const end = begin + s.size();
    for(auto at = begin; at != end; ++at)
    {
        if(*at != '@')
            continue;

        // local part, extends left to the
        // previous non-local char
        auto first = at;
        while(
            first != begin &&
            local_chars(first[-1]))
            --first;
        if(first == at)
            continue;

        auto const it = at + 1;
        auto const last = grammar::find_if_not(
            it, end, domain_chars);
        auto const n = match_domain(
            core::string_view(it, last - it));
        if(n == 0)
            continue;

        return std::string(first, it + n);
    }
    BOOST_SAFESTRING_RETURN_EC(
        error::no_address_found);
}

std::string
unescape_email_address(core::string_view s)
{
    return std::string(s.data(), s.size());
}

} // safestring
} // boost
