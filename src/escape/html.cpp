//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#include <boost/safestring/escape/html.hpp>
#include "src/escape/detail/html_entities.hpp"
#include <boost/url/grammar/digit_chars.hpp>
#include <boost/url/grammar/hexdig_chars.hpp>
#include <cstdint>

namespace boost {
namespace safestring {

namespace {

// longest name tried, longer runs are
// matched by their prefixes
constexpr std::size_t max_name_size = 32;

constexpr std::uint32_t replacement_char = 0xFFFD;

// Windows-1252 meaning of references 0x80 to 0x9F
constexpr std::uint16_t cp1252[32] = {
    0x20AC, 0x0081, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x008D, 0x017D, 0x008F,
    0x0090, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x009D, 0x017E, 0x0178
};

void
append_utf8(
    std::string& dest,
    std::uint32_t cp)
{
    if(cp < 0x80)
    {
        dest.push_back(static_cast<char>(cp));
    }
    else if(cp < 0x800)
    {
        dest.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        dest.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if(cp < 0x10000)
    {
        dest.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        dest.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        dest.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        dest.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        dest.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        dest.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        dest.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// controls and noncharacters, which a numeric
// reference produces nothing for
bool
is_dropped(std::uint32_t cp) noexcept
{
    return
        ( cp >= 0x01 && cp <= 0x08 ) ||
        cp == 0x0B ||
        ( cp >= 0x0E && cp <= 0x1F ) ||
        ( cp >= 0x7F && cp <= 0x9F ) ||
        ( cp >= 0xFDD0 && cp <= 0xFDEF ) ||
        ( cp & 0xFFFE ) == 0xFFFE;
}

void
append_numeric(
    std::string& dest,
    std::uint32_t cp)
{
    if(cp == 0)
        cp = replacement_char;
    else if(cp >= 0x80 && cp <= 0x9F)
        cp = cp1252[cp - 0x80];
    else if(
        cp > 0x10FFFF ||
        ( cp >= 0xD800 && cp <= 0xDFFF ) )
        cp = replacement_char;
    else if(is_dropped(cp))
        return;
    append_utf8(dest, cp);
}

// ref follows the '#'. Returns the number of
// chars used, or zero if ref is not a reference.
std::size_t
decode_numeric(
    std::string& dest,
    core::string_view ref)
{
    std::size_t i = 0;
    bool const hex =
        ! ref.empty() &&
        ( ref.front() == 'x' || ref.front() == 'X' );
    if(hex)
        ++i;
    auto const first = i;
    std::uint32_t v = 0;
    for(; i < ref.size(); ++i)
    {
        int d;
        if(hex)
            d = grammar::hexdig_value(ref[i]);
        else if(grammar::digit_chars(ref[i]))
            d = ref[i] - '0';
        else
            d = -1;
        if(d < 0)
            break;
        v = v * (hex ? 16 : 10) +
            static_cast<std::uint32_t>(d);
        // saturate, append_numeric replaces it
        if(v > 0x10FFFF)
            v = 0x110000;
    }
    if(i == first)
        return 0;
    if(i < ref.size() && ref[i] == ';')
        ++i;
    append_numeric(dest, v);
    return i;
}

bool
is_name_char(char c) noexcept
{
    switch(c)
    {
    case '\t':
    case '\n':
    case '\f':
    case ' ':
    case '<':
    case '&':
    case '#':
    case ';':
        return false;
    default:
        return true;
    }
}

// ref follows the '&'. Returns the number of
// chars used, or zero if ref is not a reference.
std::size_t
decode_named(
    std::string& dest,
    core::string_view ref)
{
    std::size_t n = 0;
    while(
        n < ref.size() &&
        n < max_name_size &&
        is_name_char(ref[n]))
        ++n;
    if(n == 0)
        return 0;
    if(n < ref.size() && ref[n] == ';')
        ++n;
    auto const name = ref.substr(0, n);

    if(auto e = detail::find_html_entity(name))
    {
        dest.append(e->value.data(), e->value.size());
        return n;
    }

    // the longest prefix which is a reference,
    // the rest is text
    for(auto k = n - 1; k > 1; --k)
    {
        auto e = detail::find_html_entity(
            name.substr(0, k));
        if(! e)
            continue;
        dest.append(e->value.data(), e->value.size());
        dest.append(name.data() + k, n - k);
        return n;
    }
    return 0;
}

} // (anon)

std::string
escape_html( core::string_view s )
{
    std::string result;
    result.reserve( s.size() );

    for( char c : s )
    {
        switch( c )
        {
        case '&':
            result.append( "&amp;" );
            break;
        case '<':
            result.append( "&lt;" );
            break;
        case '>':
            result.append( "&gt;" );
            break;
        case '"':
            result.append( "&quot;" );
            break;
        case '\'':
            result.append( "&#39;" );
            break;
        default:
            result.push_back( c );
            break;
        }
    }

    return result;
}

std::string
unescape_html( core::string_view s )
{
    std::string result;
    result.reserve( s.size() );

    std::size_t i = 0;
    while( i < s.size() )
    {
        char const c = s[i];
        if( c != '&' )
        {
            result.push_back( c );
            ++i;
            continue;
        }

        auto const ref = s.substr( i + 1 );
        std::size_t n;
        if( ! ref.empty() && ref.front() == '#' )
        {
            n = decode_numeric( result, ref.substr( 1 ) );
            if( n != 0 )
                ++n;
        }
        else
        {
            n = decode_named( result, ref );
        }

        if( n == 0 )
        {
            // not a reference, keep the ampersand
            result.push_back( '&' );
            ++i;
            continue;
        }
        i += n + 1;
    }

    return result;
}

} // safestring
} // boost
