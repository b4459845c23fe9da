//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#ifndef BOOST_SAFESTRING_SAFE_STRING_HPP
#define BOOST_SAFESTRING_SAFE_STRING_HPP

#include <boost/safestring/detail/config.hpp>
#include <boost/safestring/context.hpp>
#include <boost/safestring/error.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <string>

namespace boost {
namespace safestring {

/** How far the caller trusts data handed to a factory.

    @see @ref make_safe_string.
*/
enum class trust
{
    /// The data is escaped for the context.
    untrusted,

    /// The data is already safe for the context and
    /// is used verbatim.
    trusted
};

template<context C>
class basic_safe_string;

class any_safe_string;

namespace detail {

struct safe_string_access;

// one argument to format, already converted
// to text and still tagged with its context
struct format_arg
{
    core::string_view name;
    core::string_view value;
    context ctx = context::markup;
    bool tagged = false;
};

BOOST_SAFESTRING_DECL
system::result<std::string>
format_impl(
    context target,
    core::string_view tpl,
    format_arg const* args,
    std::size_t n);

BOOST_SAFESTRING_DECL
system::result<std::string>
combine_impl(
    context target,
    core::string_view lhs,
    format_arg const& rhs);

} // detail

//------------------------------------------------

/** A named argument for format.

    @see @ref arg.
*/
template<class T>
struct named_arg
{
    core::string_view name;
    T const& value;
};

/** Return a named argument for format.

    @par Example
    @code
    html_string page = html_string::from_trusted(
        "<p>{user}</p>" ).format( arg( "user", name ) );
    @endcode

    @param name The name used in the replacement field.

    @param value The argument. It is referenced, not
    copied, and must outlive the call to format.
*/
template<class T>
named_arg<T>
arg(
    core::string_view name,
    T const& value) noexcept
{
    return { name, value };
}

//------------------------------------------------

/** A string which is safe to emit into one context.

    Objects of this type hold text which may be written
    into the output context `C` without further
    processing. The only ways to obtain one are:

    @li @ref from_untrusted, which escapes the data,
    @li @ref from_trusted, which takes text the caller
        already knows to be safe for `C`,
    @li composition with `+` or @ref format, which
        upgrades every operand into `C` first.

    Operands are upgraded as follows. A string of the
    same context is used as-is. A string of another
    context is unescaped for its own context and then
    escaped for `C`. Any other text is escaped for `C`.

    @par Example
    @code
    html_string h = html_string::from_untrusted( "<b>" );
    // h.str() == "&lt;b&gt;"

    h = h + "&";
    // h.str() == "&lt;b&gt;&amp;"

    json_string j = json_string::from_untrusted( "x" );
    h = h + j;
    // h.str() == "&lt;b&gt;&amp;x"
    @endcode

    @par Thread Safety
    Objects are immutable apart from assignment.
    Distinct objects: Safe.
    Shared objects: Safe for const member functions.

    @tparam C The context the text is safe for.

    @see
        @ref any_safe_string,
        @ref escape_for,
        @ref upgrade.
*/
template<context C>
class basic_safe_string
{
    static_assert(
        detail::is_known(C),
        "C must be a known context");

    std::string s_;

    explicit
    basic_safe_string(
        std::string s) noexcept
        : s_(std::move(s))
    {
    }

    friend class any_safe_string;
    friend struct detail::safe_string_access;

public:
    /// The context this text is safe for.
    static constexpr context tag = C;

    /** Constructor.

        Default-constructed strings are empty.
    */
    basic_safe_string() = default;

    /** Return a safe string built from untrusted data.

        @throw system::system_error The data cannot be
        escaped for `C`.

        @param data The untrusted data.
    */
    static
    basic_safe_string
    from_untrusted(core::string_view data);

    /** Return a safe string built from untrusted data.

        @param data The untrusted data.

        @return The string, or the error reported by
        the context.
    */
    static
    system::result<basic_safe_string>
    try_from_untrusted(core::string_view data);

    /** Return a safe string holding text verbatim.

        The caller asserts that `text` is already safe
        for `C`. No escaping or validation takes place.

        @param text The text.
    */
    static
    basic_safe_string
    from_trusted(core::string_view text);

    /** Return parameterized text built from a template.

        Each `%s` marker in `tpl` is replaced by the
        corresponding value, neutralized and quoted.
        Only available when `C` is
        @ref context::parameterized_text.

        @note This is a textual mitigation only, see
        @ref quote_sql_value.

        @throw system::system_error The number of
        values differs from the number of markers.

        @param tpl The template, trusted.

        @param values The untrusted values.
    */
    static
    basic_safe_string
    from_template(
        core::string_view tpl,
        std::initializer_list<core::string_view> values);

    /** Return parameterized text built from a template.

        @copydetails from_template
    */
    static
    system::result<basic_safe_string>
    try_from_template(
        core::string_view tpl,
        std::initializer_list<core::string_view> values);

    /// Return the text.
    std::string const&
    str() const noexcept
    {
        return s_;
    }

    /// Return a pointer to the text.
    char const*
    data() const noexcept
    {
        return s_.data();
    }

    /// Return a null-terminated copy of the text.
    char const*
    c_str() const noexcept
    {
        return s_.c_str();
    }

    /// Return the size of the text.
    std::size_t
    size() const noexcept
    {
        return s_.size();
    }

    /// Return true if the text is empty.
    bool
    empty() const noexcept
    {
        return s_.empty();
    }

    /// Return the text.
    operator core::string_view() const noexcept
    {
        return { s_.data(), s_.size() };
    }

    //--------------------------------------------

    /** Return this string followed by another string.

        @param other A string of any context, which is
        upgraded into `C`.
    */
    template<context D>
    system::result<basic_safe_string>
    try_append(
        basic_safe_string<D> const& other) const;

    /** Return this string followed by untrusted text.

        @param other The text, which is escaped for `C`.
    */
    system::result<basic_safe_string>
    try_append(core::string_view other) const;

    /** Return this string followed by another string.

        @param other A string of any context, which is
        upgraded into `C`.
    */
    system::result<basic_safe_string>
    try_append(any_safe_string const& other) const;

    /** Append to this string.

        The string is replaced by the combination of
        its text and the upgraded operand.

        @throw system::system_error The operand cannot
        be upgraded into `C`.
    */
    template<class T>
    basic_safe_string&
    operator+=(T const& other);

    //--------------------------------------------

    /** Substitute arguments into this string.

        This string is the template. Replacement fields
        have the form `{}`, `{N}` or `{name}`; `{{` and
        `}}` stand for literal braces. Every argument is
        upgraded into `C` before substitution.

        Arguments may be safe strings of any context,
        any type convertible to `core::string_view`,
        integers, or named arguments created with
        @ref arg.

        @par Example
        @code
        auto h = html_string::from_trusted( "<a title=\"{}\">{n}</a>" )
            .format( "\"quoted\"", arg( "n", 42 ) );
        // h.str() == "<a title=\"&quot;quoted&quot;\">42</a>"
        @endcode

        @throw system::system_error The template is
        malformed, an argument is missing, or an
        argument cannot be upgraded.
    */
    template<class... Args>
    basic_safe_string
    format(Args const&... args) const;

    /** Substitute arguments into this string.

        @copydetails format

        @return The string, or the first error.
    */
    template<class... Args>
    system::result<basic_safe_string>
    try_format(Args const&... args) const;

    //--------------------------------------------

    friend
    bool
    operator==(
        basic_safe_string const& a,
        basic_safe_string const& b) noexcept
    {
        return a.s_ == b.s_;
    }

    friend
    bool
    operator!=(
        basic_safe_string const& a,
        basic_safe_string const& b) noexcept
    {
        return a.s_ != b.s_;
    }

    friend
    bool
    operator<(
        basic_safe_string const& a,
        basic_safe_string const& b) noexcept
    {
        return a.s_ < b.s_;
    }
};

/// Text safe for HTML.
using html_string = basic_safe_string<context::markup>;

/// A JSON string literal.
using json_string = basic_safe_string<context::structured_data>;

/// A URL safe for HTTP headers and links.
using url_string = basic_safe_string<context::url>;

/// A single query argument.
using query_argument_string = basic_safe_string<context::query_argument>;

/// A single email address.
using email_address_string = basic_safe_string<context::email_address>;

/** Parameterized text.

    @note This is a textual mitigation only, see
    @ref quote_sql_value.
*/
using sql_string = basic_safe_string<context::parameterized_text>;

//------------------------------------------------

/** A safe string whose context is chosen at runtime.

    This holds the same guarantee as
    @ref basic_safe_string, with the context stored
    in the object. Every `basic_safe_string`
    converts to it implicitly.

    @par Example
    @code
    any_safe_string s = make_safe_string(
        context::query_argument, "a b", trust::untrusted );
    // s.kind() == context::query_argument
    // s.str() == "a+b"
    @endcode

    @see @ref make_safe_string.
*/
class any_safe_string
{
    std::string s_;
    context c_ = context::markup;

    any_safe_string(
        context c,
        std::string s) noexcept
        : s_(std::move(s))
        , c_(c)
    {
    }

    friend struct detail::safe_string_access;

public:
    /** Constructor.

        The string holds the text and context of `v`.
    */
    template<context C>
    any_safe_string(
        basic_safe_string<C> const& v)
        : s_(v.s_)
        , c_(C)
    {
    }

    /** Constructor.

        The string takes the text and context of `v`.
    */
    template<context C>
    any_safe_string(
        basic_safe_string<C>&& v) noexcept
        : s_(std::move(v.s_))
        , c_(C)
    {
    }

    /// Return the context this text is safe for.
    context
    kind() const noexcept
    {
        return c_;
    }

    /// Return the text.
    std::string const&
    str() const noexcept
    {
        return s_;
    }

    /// Return a pointer to the text.
    char const*
    data() const noexcept
    {
        return s_.data();
    }

    /// Return the size of the text.
    std::size_t
    size() const noexcept
    {
        return s_.size();
    }

    /// Return true if the text is empty.
    bool
    empty() const noexcept
    {
        return s_.empty();
    }

    /// Return the text.
    operator core::string_view() const noexcept
    {
        return { s_.data(), s_.size() };
    }

    /** Return this string followed by another string.

        @param other The operand, upgraded into
        `this->kind()`.
    */
    BOOST_SAFESTRING_DECL
    system::result<any_safe_string>
    try_append(any_safe_string const& other) const;

    /** Return this string followed by untrusted text.

        @param other The text, escaped for
        `this->kind()`.
    */
    BOOST_SAFESTRING_DECL
    system::result<any_safe_string>
    try_append(core::string_view other) const;

    /** Return this string followed by another string.

        @param other The operand, upgraded into
        `this->kind()`.
    */
    template<context C>
    system::result<any_safe_string>
    try_append(basic_safe_string<C> const& other) const;

    /** Return this string followed by another string.

        @throw system::system_error The operand cannot
        be upgraded.
    */
    BOOST_SAFESTRING_DECL
    any_safe_string
    append(any_safe_string const& other) const;

    /** Return this string followed by another string.

        @throw system::system_error The operand cannot
        be upgraded.
    */
    template<context C>
    any_safe_string
    append(basic_safe_string<C> const& other) const;

    /** Return this string followed by untrusted text.

        @throw system::system_error The text cannot be
        escaped.
    */
    BOOST_SAFESTRING_DECL
    any_safe_string
    append(core::string_view other) const;

    /** Substitute arguments into this string.

        @see basic_safe_string::format.
    */
    template<class... Args>
    any_safe_string
    format(Args const&... args) const;

    /** Substitute arguments into this string.

        @see basic_safe_string::try_format.
    */
    template<class... Args>
    system::result<any_safe_string>
    try_format(Args const&... args) const;

    /** Return this string upgraded into context `C`.

        @return The typed string, or the error from
        @ref upgrade.
    */
    template<context C>
    system::result<basic_safe_string<C>>
    as() const;

    friend
    bool
    operator==(
        any_safe_string const& a,
        any_safe_string const& b) noexcept
    {
        return a.c_ == b.c_ && a.s_ == b.s_;
    }

    friend
    bool
    operator!=(
        any_safe_string const& a,
        any_safe_string const& b) noexcept
    {
        return !(a == b);
    }
};

//------------------------------------------------

/** Return a safe string for a context chosen at runtime.

    @param c The context.

    @param data The data.

    @param t If @ref trust::untrusted the data is
    escaped for `c`, otherwise it is used verbatim.

    @return The string, the error reported by the
    context, or @ref error::unimplemented_context if
    `c` is not a known context.
*/
BOOST_SAFESTRING_DECL
system::result<any_safe_string>
try_make_safe_string(
    context c,
    core::string_view data,
    trust t);

/** Return a safe string for a context chosen at runtime.

    @throw system::system_error The data cannot be
    escaped for `c`, or `c` is not a known context.

    @see @ref try_make_safe_string.
*/
BOOST_SAFESTRING_DECL
any_safe_string
make_safe_string(
    context c,
    core::string_view data,
    trust t);

/** Return a string followed by another string.

    The result has the context of `lhs`.

    @throw system::system_error The operand cannot be
    upgraded into `C`.
*/
template<context C, context D>
basic_safe_string<C>
operator+(
    basic_safe_string<C> const& lhs,
    basic_safe_string<D> const& rhs);

/** Return a string followed by untrusted text.

    @throw system::system_error The text cannot be
    escaped for `C`.
*/
template<context C>
basic_safe_string<C>
operator+(
    basic_safe_string<C> const& lhs,
    core::string_view rhs);

/** Return a string followed by another string.

    @throw system::system_error The operand cannot be
    upgraded into `C`.
*/
template<context C>
basic_safe_string<C>
operator+(
    basic_safe_string<C> const& lhs,
    any_safe_string const& rhs);

/// Format the text to an output stream.
template<context C>
std::ostream&
operator<<(
    std::ostream& os,
    basic_safe_string<C> const& s);

/// Format the text to an output stream.
BOOST_SAFESTRING_DECL
std::ostream&
operator<<(
    std::ostream& os,
    any_safe_string const& s);

} // safestring
} // boost

namespace std {

template<::boost::safestring::context C>
struct hash<::boost::safestring::basic_safe_string<C>>
{
    std::size_t
    operator()(
        ::boost::safestring::basic_safe_string<C> const& s
            ) const noexcept
    {
        return std::hash<std::string>()(s.str());
    }
};

} // std

#include <boost/safestring/impl/safe_string.hpp>

#endif
