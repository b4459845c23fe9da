//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#ifndef BOOST_SAFESTRING_HPP
#define BOOST_SAFESTRING_HPP

#include <boost/safestring/config.hpp>
#include <boost/safestring/context.hpp>
#include <boost/safestring/error.hpp>
#include <boost/safestring/escape.hpp>
#include <boost/safestring/safe_string.hpp>

#include <boost/safestring/escape/email.hpp>
#include <boost/safestring/escape/html.hpp>
#include <boost/safestring/escape/json.hpp>
#include <boost/safestring/escape/query.hpp>
#include <boost/safestring/escape/sql.hpp>
#include <boost/safestring/escape/url.hpp>

#endif
