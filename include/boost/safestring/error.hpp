//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#ifndef BOOST_SAFESTRING_ERROR_HPP
#define BOOST_SAFESTRING_ERROR_HPP

#include <boost/safestring/detail/config.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

namespace boost {
namespace safestring {

/** Error codes returned by escaping, unescaping and composition.

    Errors are reported at the point of the offending call.
    Nothing is retried and no partial result is produced.
*/
enum class error
{
    /// Success
    ok = 0,

    /**
     * The operation was invoked with a context which
     * is not one of the known output contexts.
    */
    unimplemented_context,

    /**
     * The decoded value is not text.

       Returned when a structured-data literal is
       well-formed but holds a number, object, array,
       boolean or null instead of a string.
    */
    type_mismatch,

    /**
     * The number of values does not equal the number
     * of placeholder markers in a parameterized template.
    */
    placeholder_count_mismatch,

    /**
     * The input contains no well-formed email address.
    */
    no_address_found,

    /**
     * The input does not conform to the encoding
     * rules of its context.
    */
    malformed_encoding,

    /**
     * The context has no inverse transformation.
    */
    not_reversible,

    /**
     * A format template has an unbalanced brace or
     * an unsupported replacement field.
    */
    bad_format_string,

    /**
     * A format replacement field names an argument
     * which was not supplied.
    */
    missing_argument
};

//------------------------------------------------

/** Error conditions grouping the error codes.
*/
enum class condition
{
    /**
     * The input was rejected.

       Matches @ref error::type_mismatch,
       @ref error::placeholder_count_mismatch,
       @ref error::no_address_found,
       @ref error::malformed_encoding,
       @ref error::bad_format_string and
       @ref error::missing_argument.
    */
    invalid_input = 1,

    /**
     * The operation is not available for the context.

       Matches @ref error::unimplemented_context and
       @ref error::not_reversible.
    */
    unsupported_operation
};

} // safestring
} // boost

#include <boost/safestring/impl/error.hpp>

#endif
