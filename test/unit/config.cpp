//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

// Test that header file is self-contained.
#include <boost/safestring/config.hpp>

#include "test_suite.hpp"

#include <stdexcept>

namespace boost {
namespace safestring {

struct config_test
{
    void
    test_defaults()
    {
        escape_config cfg;
        BOOST_TEST(cfg.query.space_as_plus);
        BOOST_TEST(cfg.url.normalize);
        BOOST_TEST_EQ(cfg.sql.quote, '\'');
    }

    void
    test_validate()
    {
        escape_config cfg;
        validate(cfg);

        cfg.sql.quote = '"';
        validate(cfg);
        validate(cfg.sql);

        cfg.sql.quote = 'x';
        BOOST_TEST_THROWS(
            validate(cfg),
            std::invalid_argument);
        BOOST_TEST_THROWS(
            validate(cfg.sql),
            std::invalid_argument);

        cfg.sql.quote = '\0';
        BOOST_TEST_THROWS(
            validate(cfg),
            std::invalid_argument);
    }

    void
    run()
    {
        test_defaults();
        test_validate();
    }
};

TEST_SUITE(
    config_test,
    "boost.safestring.config");

} // safestring
} // boost
