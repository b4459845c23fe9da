//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#include <boost/safestring/escape/sql.hpp>

namespace boost {
namespace safestring {

namespace {

// a %s marker and the value spliced into it
struct binding
{
    std::size_t offset;
    core::string_view value;
};

std::vector<binding>
find_markers(core::string_view tpl)
{
    std::vector<binding> v;
    for(std::size_t i = 0; i + 1 < tpl.size(); ++i)
    {
        if(tpl[i] != '%')
            continue;
        if(tpl[i + 1] == 's')
            v.push_back({ i, {} });
        // "%%" is never the start of a marker
        ++i;
    }
    return v;
}

void
append_quoted(
    std::string& dest,
    core::string_view v,
    char quote)
{
    dest.push_back(quote);
    for(char c : v)
    {
        switch(c)
        {
        case '\\':
        case '\'':
        case '"':
        case '/':
            dest.push_back('\\');
            dest.push_back(c);
            break;
        case '\n':
        case '\r':
        case '\t':
        case '\0':
            break;
        default:
            dest.push_back(c);
            break;
        }
    }
    dest.push_back(quote);
}

system::result<std::string>
format_sql_impl(
    core::string_view tpl,
    core::string_view const* values,
    std::size_t n,
    sql_config const& cfg)
{
    validate(cfg);

    auto bindings = find_markers(tpl);
    if(bindings.size() != n)
        BOOST_SAFESTRING_RETURN_EC(
            error::placeholder_count_mismatch);
    for(std::size_t k = 0; k < n; ++k)
        bindings[k].value = values[k];

    std::string result;
    result.reserve(tpl.size() + 4 * n);
    auto next = bindings.begin();
    std::size_t i = 0;
    while(i < tpl.size())
    {
        if( next != bindings.end() &&
            next->offset == i)
        {
            append_quoted(result, next->value, cfg.quote);
            ++next;
            i += 2;
            continue;
        }
        if( tpl[i] == '%' &&
            i + 1 < tpl.size() &&
            tpl[i + 1] == '%')
        {
            result.push_back('%');
            i += 2;
            continue;
        }
        result.push_back(tpl[i]);
        ++i;
    }
    return result;
}

} // (anon)

std::string
quote_sql_value(
    core::string_view v,
    sql_config const& cfg)
{
    validate(cfg);
    std::string result;
    result.reserve(v.size() + 2);
    append_quoted(result, v, cfg.quote);
    return result;
}

system::result<std::string>
format_sql(
    core::string_view tpl,
    std::initializer_list<core::string_view> values,
    sql_config const& cfg)
{
    return format_sql_impl(
        tpl, values.begin(), values.size(), cfg);
}

system::result<std::string>
format_sql(
    core::string_view tpl,
    std::vector<std::string> const& values,
    sql_config const& cfg)
{
    std::vector<core::string_view> v(
        values.begin(), values.end());
    return format_sql_impl(
        tpl, v.data(), v.size(), cfg);
}

} // safestring
} // boost
