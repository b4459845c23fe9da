//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#include <boost/safestring/safe_string.hpp>
#include <boost/url/grammar/alnum_chars.hpp>
#include <boost/url/grammar/alpha_chars.hpp>
#include <boost/url/grammar/digit_chars.hpp>
#include <ostream>
#include <vector>

namespace boost {
namespace safestring {

namespace detail {

namespace {

// index of a positional argument larger
// than this is treated as missing
constexpr std::size_t max_index_digits = 9;

system::result<std::string>
upgrade_arg(
    context target,
    format_arg const& a)
{
    if(a.tagged)
        return upgrade(target, a.ctx, a.value);
    return escape_for(target, a.value);
}

bool
is_identifier(core::string_view s) noexcept
{
    if(s.empty())
        return false;
    if( ! grammar::alpha_chars(s.front()) &&
        s.front() != '_')
        return false;
    for(char c : s.substr(1))
        if( ! grammar::alnum_chars(c) &&
            c != '_')
            return false;
    return true;
}

bool
is_number(core::string_view s) noexcept
{
    if(s.empty())
        return false;
    for(char c : s)
        if(! grammar::digit_chars(c))
            return false;
    return true;
}

// Resolves the replacement fields of a template
// to argument indexes, tracking automatic and
// manual numbering.
class field_resolver
{
    format_arg const* args_;
    std::size_t n_;
    std::size_t next_ = 0;
    bool automatic_ = false;
    bool manual_ = false;

    system::result<std::size_t>
    positional(std::size_t index) const
    {
        for(std::size_t i = 0; i < n_; ++i)
        {
            if(! args_[i].name.empty())
                continue;
            if(index-- == 0)
                return i;
        }
        BOOST_SAFESTRING_RETURN_EC(
            error::missing_argument);
    }

    system::result<std::size_t>
    named(core::string_view name) const
    {
        for(std::size_t i = 0; i < n_; ++i)
            if(args_[i].name == name)
                return i;
        BOOST_SAFESTRING_RETURN_EC(
            error::missing_argument);
    }

public:
    field_resolver(
        format_arg const* args,
        std::size_t n) noexcept
        : args_(args)
        , n_(n)
    {
    }

    system::result<std::size_t>
    resolve(core::string_view field)
    {
        if(field.empty())
        {
            if(manual_)
                BOOST_SAFESTRING_RETURN_EC(
                    error::bad_format_string);
            automatic_ = true;
            return positional(next_++);
        }

        if(is_number(field))
        {
            if(automatic_)
                BOOST_SAFESTRING_RETURN_EC(
                    error::bad_format_string);
            manual_ = true;
            if(field.size() > max_index_digits)
                BOOST_SAFESTRING_RETURN_EC(
                    error::missing_argument);
            std::size_t index = 0;
            for(char c : field)
                index = index * 10 + static_cast<
                    std::size_t>(c - '0');
            return positional(index);
        }

        if(is_identifier(field))
            return named(field);

        // format specs, conversions, nested fields
        BOOST_SAFESTRING_RETURN_EC(
            error::bad_format_string);
    }
};

} // (anon)

system::result<std::string>
combine_impl(
    context target,
    core::string_view lhs,
    format_arg const& rhs)
{
    auto rv = upgrade_arg(target, rhs);
    if(rv.has_error())
        return rv.error();

    std::string result;
    result.reserve(lhs.size() + rv->size());
    result.append(lhs.data(), lhs.size());
    result.append(*rv);
    return result;
}

system::result<std::string>
format_impl(
    context target,
    core::string_view tpl,
    format_arg const* args,
    std::size_t n)
{
    // every argument is upgraded, used or not
    std::vector<std::string> values;
    values.reserve(n);
    for(std::size_t i = 0; i < n; ++i)
    {
        auto rv = upgrade_arg(target, args[i]);
        if(rv.has_error())
            return rv.error();
        values.push_back(std::move(*rv));
    }

    field_resolver fields(args, n);
    std::string result;
    result.reserve(tpl.size());
    std::size_t i = 0;
    while(i < tpl.size())
    {
        char const c = tpl[i];
        if(c == '}')
        {
            if( i + 1 < tpl.size() &&
                tpl[i + 1] == '}')
            {
                result.push_back('}');
                i += 2;
                continue;
            }
            BOOST_SAFESTRING_RETURN_EC(
                error::bad_format_string);
        }
        if(c != '{')
        {
            result.push_back(c);
            ++i;
            continue;
        }
        if( i + 1 < tpl.size() &&
            tpl[i + 1] == '{')
        {
            result.push_back('{');
            i += 2;
            continue;
        }

        auto const close = tpl.find('}', i + 1);
        if(close == core::string_view::npos)
            BOOST_SAFESTRING_RETURN_EC(
                error::bad_format_string);

        auto k = fields.resolve(
            tpl.substr(i + 1, close - i - 1));
        if(k.has_error())
            return k.error();
        result.append(values[*k]);
        i = close + 1;
    }
    return result;
}

} // detail

//------------------------------------------------

system::result<any_safe_string>
any_safe_string::
try_append(any_safe_string const& other) const
{
    std::string buf;
    return detail::safe_string_access::wrap_any(c_,
        detail::combine_impl(c_, s_,
            detail::make_format_arg(other, buf)));
}

system::result<any_safe_string>
any_safe_string::
try_append(core::string_view other) const
{
    std::string buf;
    return detail::safe_string_access::wrap_any(c_,
        detail::combine_impl(c_, s_,
            detail::make_format_arg(other, buf)));
}

any_safe_string
any_safe_string::
append(any_safe_string const& other) const
{
    return try_append(other).value();
}

any_safe_string
any_safe_string::
append(core::string_view other) const
{
    return try_append(other).value();
}

//------------------------------------------------

system::result<any_safe_string>
try_make_safe_string(
    context c,
    core::string_view data,
    trust t)
{
    if(! detail::is_known(c))
        BOOST_SAFESTRING_RETURN_EC(
            error::unimplemented_context);
    if(t == trust::trusted)
        return detail::safe_string_access::construct(
            c, std::string(data.data(), data.size()));
    return detail::safe_string_access::wrap_any(
        c, escape_for(c, data));
}

any_safe_string
make_safe_string(
    context c,
    core::string_view data,
    trust t)
{
    return try_make_safe_string(c, data, t).value();
}

std::ostream&
operator<<(
    std::ostream& os,
    any_safe_string const& s)
{
    os << s.str();
    return os;
}

} // safestring
} // boost
