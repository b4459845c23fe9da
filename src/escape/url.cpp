//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#include <boost/safestring/escape/url.hpp>
#include <boost/url/grammar/alpha_chars.hpp>
#include <boost/url/grammar/hexdig_chars.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>
#include <algorithm>

namespace boost {
namespace safestring {

namespace {

// Check if character can appear in a URL unencoded
// Unreserved + reserved chars, except the
// delimiters '#', '[' and ']' which depend on
// their position
bool
is_safe( char c ) noexcept
{
    // Unreserved: A-Z a-z 0-9 - _ . ~
    if( ( c >= 'A' && c <= 'Z' ) ||
        ( c >= 'a' && c <= 'z' ) ||
        ( c >= '0' && c <= '9' ) ||
        c == '-' || c == '_' || c == '.' || c == '~' )
        return true;

    // Reserved chars allowed anywhere: ! $ & ' ( ) * + , / : ; = ? @
    switch( c )
    {
    case '!':
    case '$':
    case '&':
    case '\'':
    case '(':
    case ')':
    case '*':
    case '+':
    case ',':
    case '/':
    case ':':
    case ';':
    case '=':
    case '?':
    case '@':
        return true;
    default:
        return false;
    }
}

constexpr grammar::lut_chars scheme_chars(
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789"
    "+-.");

// space, controls and DEL
bool
is_blank( char c ) noexcept
{
    auto const u = static_cast<unsigned char>( c );
    return u <= 0x20 || u == 0x7F;
}

bool
is_pct_escape(
    core::string_view s,
    std::size_t i ) noexcept
{
    return
        i + 2 < s.size() &&
        s[i] == '%' &&
        grammar::hexdig_value( s[i + 1] ) >= 0 &&
        grammar::hexdig_value( s[i + 2] ) >= 0;
}

// Return the offset of the authority, or npos
// if s has none
std::size_t
authority_offset( core::string_view s ) noexcept
{
    if( s.substr( 0, 2 ) == "//" )
        return 2;
    auto const colon = s.find( ':' );
    if( colon == core::string_view::npos ||
        colon == 0 ||
        ! grammar::alpha_chars( s[0] ) )
        return core::string_view::npos;
    for( std::size_t i = 1; i < colon; ++i )
        if( ! scheme_chars( s[i] ) )
            return core::string_view::npos;
    if( s.substr( colon + 1, 2 ) != "//" )
        return core::string_view::npos;
    return colon + 3;
}

// The brackets of an IP literal host. Only
// these are kept, every other bracket is
// encoded.
struct ip_literal
{
    std::size_t open = core::string_view::npos;
    std::size_t close = core::string_view::npos;
};

ip_literal
find_ip_literal( core::string_view s ) noexcept
{
    ip_literal lit;
    auto const first = authority_offset( s );
    if( first == core::string_view::npos )
        return lit;
    auto const last = ( std::min )(
        s.find_first_of( "/?#", first ), s.size() );
    auto host = first;
    auto const at = s.substr(
        first, last - first ).rfind( '@' );
    if( at != core::string_view::npos )
        host = first + at + 1;
    if( host >= last || s[host] != '[' )
        return lit;
    lit.open = host;
    auto const close = s.find( ']', host );
    if( close < last )
        lit.close = close;
    return lit;
}

constexpr char hex_chars[] = "0123456789ABCDEF";

void
append_pct(
    std::string& dest,
    char c )
{
    auto const u = static_cast<unsigned char>( c );
    dest.push_back( '%' );
    dest.push_back( hex_chars[u >> 4] );
    dest.push_back( hex_chars[u & 0x0F] );
}

} // (anon)

system::result<std::string>
escape_url(
    core::string_view s,
    url_config const& cfg )
{
    // only the first line, a newline could
    // start a new header
    auto const eol = s.find_first_of( "\r\n" );
    if( eol != core::string_view::npos )
        s = s.substr( 0, eol );

    while( ! s.empty() && is_blank( s.front() ) )
        s.remove_prefix( 1 );
    while( ! s.empty() && is_blank( s.back() ) )
        s.remove_suffix( 1 );

    auto const lit = find_ip_literal( s );
    bool in_fragment = false;

    std::string result;
    result.reserve( s.size() );

    for( std::size_t i = 0; i < s.size(); ++i )
    {
        char const c = s[i];
        switch( c )
        {
        case '\t':
            continue;

        case '#':
            // the first one starts the fragment
            if( in_fragment )
                append_pct( result, c );
            else
                result.push_back( c );
            in_fragment = true;
            continue;

        case '[':
        case ']':
            if( i == lit.open || i == lit.close )
                result.push_back( c );
            else
                append_pct( result, c );
            continue;

        default:
            break;
        }

        if( is_safe( c ) ||
            is_pct_escape( s, i ) )
            result.push_back( c );
        else
            append_pct( result, c );
    }

    // still invalid, for example an unterminated
    // IP literal or a port which is not a number
    auto rv = urls::parse_uri_reference( result );
    if( rv.has_error() )
        BOOST_SAFESTRING_RETURN_EC(
            error::malformed_encoding );

    if( ! cfg.normalize )
        return result;

    urls::url u( *rv );
    u.normalize();
    auto const buf = u.buffer();
    return std::string( buf.data(), buf.size() );
}

std::string
unescape_url( core::string_view s )
{
    return std::string( s.data(), s.size() );
}

} // safestring
} // boost
