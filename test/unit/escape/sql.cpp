//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

// Test that header file is self-contained.
#include <boost/safestring/escape/sql.hpp>

#include "test_helpers.hpp"

#include <stdexcept>

namespace boost {
namespace safestring {

struct sql_test
{
    void
    test_quote()
    {
        BOOST_TEST_EQ(quote_sql_value(""), "''");
        BOOST_TEST_EQ(quote_sql_value("5"), "'5'");
        BOOST_TEST_EQ(quote_sql_value("O'Brien"), "'O\\'Brien'");
        BOOST_TEST_EQ(quote_sql_value("a\"b"), "'a\\\"b'");
        BOOST_TEST_EQ(quote_sql_value("a\\b"), "'a\\\\b'");
        BOOST_TEST_EQ(quote_sql_value("a/b"), "'a\\/b'");
        BOOST_TEST_EQ(quote_sql_value("x\r\n\ty"), "'xy'");
        BOOST_TEST_EQ(
            quote_sql_value(core::string_view("a\0b", 3)), "'ab'");
        BOOST_TEST_EQ(
            quote_sql_value("' OR '1'='1"),
            "'\\' OR \\'1\\'=\\'1'");

        sql_config cfg;
        cfg.quote = '"';
        BOOST_TEST_EQ(quote_sql_value("it's", cfg), "\"it\\'s\"");

        cfg.quote = '`';
        BOOST_TEST_THROWS(
            quote_sql_value("x", cfg),
            std::invalid_argument);
    }

    void
    test_format()
    {
        check_ok(
            format_sql(
                "SELECT * FROM t WHERE name = %s AND id = %s",
                { "O'Brien", "5" }),
            "SELECT * FROM t WHERE name = 'O\\'Brien' AND id = '5'");
        check_ok(format_sql("SELECT 1", {}), "SELECT 1");
        check_ok(format_sql("%s", { "" }), "''");

        // literal percent
        check_ok(
            format_sql("LIKE %s ESCAPE '%%'", { "50%" }),
            "LIKE '50%' ESCAPE '%'");
        check_ok(format_sql("%%s", {}), "%s");
        check_ok(format_sql("100%", {}), "100%");

        // markers inside values are not expanded
        check_ok(format_sql("%s %s", { "%s", "x" }), "'%s' 'x'");

        std::vector<std::string> v;
        v.push_back("a");
        v.push_back("b'c");
        check_ok(format_sql("(%s, %s)", v), "('a', 'b\\'c')");

        sql_config cfg;
        cfg.quote = '"';
        check_ok(format_sql("x = %s", { "y" }, cfg), "x = \"y\"");
    }

    void
    test_mismatch()
    {
        check_err(
            format_sql("%s AND %s", { "a" }),
            error::placeholder_count_mismatch);
        check_err(
            format_sql("%s", { "a", "b" }),
            error::placeholder_count_mismatch);
        check_err(
            format_sql("%%s", { "a" }),
            error::placeholder_count_mismatch);
        check_err(
            format_sql("none", std::vector<std::string>(1)),
            error::placeholder_count_mismatch);
    }

    void
    run()
    {
        test_quote();
        test_format();
        test_mismatch();
    }
};

TEST_SUITE(
    sql_test,
    "boost.safestring.escape.sql");

} // safestring
} // boost
