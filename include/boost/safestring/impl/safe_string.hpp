//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#ifndef BOOST_SAFESTRING_IMPL_SAFE_STRING_HPP
#define BOOST_SAFESTRING_IMPL_SAFE_STRING_HPP

#include <boost/safestring/escape.hpp>
#include <boost/safestring/escape/sql.hpp>
#include <ostream>
#include <type_traits>
#include <utility>

namespace boost {
namespace safestring {

namespace detail {

struct safe_string_access
{
    template<context C>
    static
    system::result<basic_safe_string<C>>
    wrap(system::result<std::string>&& rv)
    {
        if(rv.has_error())
            return rv.error();
        return basic_safe_string<C>(
            std::move(*rv));
    }

    static
    system::result<any_safe_string>
    wrap_any(
        context c,
        system::result<std::string>&& rv)
    {
        if(rv.has_error())
            return rv.error();
        return any_safe_string(
            c, std::move(*rv));
    }

    static
    any_safe_string
    construct(
        context c,
        std::string s) noexcept
    {
        return any_safe_string(
            c, std::move(s));
    }
};

//------------------------------------------------

// The overloads below turn each format
// argument into a format_arg. The buffer
// holds the text of arguments which are
// not strings.

inline
format_arg
make_format_arg(
    core::string_view s,
    std::string&) noexcept
{
    format_arg a;
    a.value = s;
    return a;
}

template<context C>
format_arg
make_format_arg(
    basic_safe_string<C> const& v,
    std::string&) noexcept
{
    format_arg a;
    a.value = v;
    a.ctx = C;
    a.tagged = true;
    return a;
}

inline
format_arg
make_format_arg(
    any_safe_string const& v,
    std::string&) noexcept
{
    format_arg a;
    a.value = v;
    a.ctx = v.kind();
    a.tagged = true;
    return a;
}

template<
    class T,
    typename std::enable_if<
        std::is_integral<T>::value &&
        ! std::is_same<T, bool>::value &&
        ! std::is_same<T, char>::value,
        int>::type = 0>
format_arg
make_format_arg(
    T v,
    std::string& buf)
{
    buf = std::to_string(v);
    format_arg a;
    a.value = buf;
    return a;
}

template<class T>
format_arg
make_format_arg(
    named_arg<T> const& na,
    std::string& buf)
{
    format_arg a = make_format_arg(
        na.value, buf);
    a.name = na.name;
    return a;
}

template<class... Args>
system::result<std::string>
format_args(
    context target,
    core::string_view tpl,
    Args const&... args)
{
    constexpr std::size_t n = sizeof...(Args);
    // one extra element avoids a zero-sized array
    std::string storage[n + 1];
    format_arg fa[n + 1];
    std::size_t i = 0;
    ((fa[i] = make_format_arg(args, storage[i]), ++i), ...);
    (void)i;
    return format_impl(target, tpl, fa, n);
}

} // detail

//------------------------------------------------

template<context C>
auto
basic_safe_string<C>::
from_untrusted(
    core::string_view data) ->
        basic_safe_string
{
    return try_from_untrusted(data).value();
}

template<context C>
auto
basic_safe_string<C>::
try_from_untrusted(
    core::string_view data) ->
        system::result<basic_safe_string>
{
    return detail::safe_string_access::wrap<C>(
        escape_for(C, data));
}

template<context C>
auto
basic_safe_string<C>::
from_trusted(
    core::string_view text) ->
        basic_safe_string
{
    return basic_safe_string(
        std::string(text.data(), text.size()));
}

template<context C>
auto
basic_safe_string<C>::
from_template(
    core::string_view tpl,
    std::initializer_list<core::string_view> values) ->
        basic_safe_string
{
    return try_from_template(tpl, values).value();
}

template<context C>
auto
basic_safe_string<C>::
try_from_template(
    core::string_view tpl,
    std::initializer_list<core::string_view> values) ->
        system::result<basic_safe_string>
{
    static_assert(
        C == context::parameterized_text,
        "from_template requires context::parameterized_text");
    return detail::safe_string_access::wrap<C>(
        format_sql(tpl, values));
}

template<context C>
template<context D>
auto
basic_safe_string<C>::
try_append(
    basic_safe_string<D> const& other) const ->
        system::result<basic_safe_string>
{
    if constexpr(C == D)
    {
        // same context, already safe
        return basic_safe_string(s_ + other.str());
    }
    else
    {
        std::string buf;
        return detail::safe_string_access::wrap<C>(
            detail::combine_impl(C, s_,
                detail::make_format_arg(other, buf)));
    }
}

template<context C>
auto
basic_safe_string<C>::
try_append(
    core::string_view other) const ->
        system::result<basic_safe_string>
{
    std::string buf;
    return detail::safe_string_access::wrap<C>(
        detail::combine_impl(C, s_,
            detail::make_format_arg(other, buf)));
}

template<context C>
auto
basic_safe_string<C>::
try_append(
    any_safe_string const& other) const ->
        system::result<basic_safe_string>
{
    std::string buf;
    return detail::safe_string_access::wrap<C>(
        detail::combine_impl(C, s_,
            detail::make_format_arg(other, buf)));
}

template<context C>
template<class T>
auto
basic_safe_string<C>::
operator+=(
    T const& other) ->
        basic_safe_string&
{
    *this = *this + other;
    return *this;
}

template<context C>
template<class... Args>
auto
basic_safe_string<C>::
format(
    Args const&... args) const ->
        basic_safe_string
{
    return try_format(args...).value();
}

template<context C>
template<class... Args>
auto
basic_safe_string<C>::
try_format(
    Args const&... args) const ->
        system::result<basic_safe_string>
{
    return detail::safe_string_access::wrap<C>(
        detail::format_args(C, s_, args...));
}

//------------------------------------------------

template<context C>
auto
any_safe_string::
try_append(
    basic_safe_string<C> const& other) const ->
        system::result<any_safe_string>
{
    std::string buf;
    return detail::safe_string_access::wrap_any(c_,
        detail::combine_impl(c_, s_,
            detail::make_format_arg(other, buf)));
}

template<context C>
any_safe_string
any_safe_string::
append(
    basic_safe_string<C> const& other) const
{
    return try_append(other).value();
}

template<class... Args>
any_safe_string
any_safe_string::
format(
    Args const&... args) const
{
    return try_format(args...).value();
}

template<class... Args>
auto
any_safe_string::
try_format(
    Args const&... args) const ->
        system::result<any_safe_string>
{
    return detail::safe_string_access::wrap_any(c_,
        detail::format_args(c_, s_, args...));
}

template<context C>
auto
any_safe_string::
as() const ->
    system::result<basic_safe_string<C>>
{
    return detail::safe_string_access::wrap<C>(
        upgrade(C, c_, s_));
}

//------------------------------------------------

template<context C, context D>
basic_safe_string<C>
operator+(
    basic_safe_string<C> const& lhs,
    basic_safe_string<D> const& rhs)
{
    return lhs.try_append(rhs).value();
}

template<context C>
basic_safe_string<C>
operator+(
    basic_safe_string<C> const& lhs,
    core::string_view rhs)
{
    return lhs.try_append(rhs).value();
}

template<context C>
basic_safe_string<C>
operator+(
    basic_safe_string<C> const& lhs,
    any_safe_string const& rhs)
{
    return lhs.try_append(rhs).value();
}

template<context C>
std::ostream&
operator<<(
    std::ostream& os,
    basic_safe_string<C> const& s)
{
    os << s.str();
    return os;
}

} // safestring
} // boost

#endif
