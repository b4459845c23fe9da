//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#ifndef BOOST_SAFESTRING_TEST_SUITE_HPP
#define BOOST_SAFESTRING_TEST_SUITE_HPP

#include <boost/core/lightweight_test.hpp>

// Each test source defines a struct with a run()
// member and registers it with TEST_SUITE. The
// single test driver in main.cpp runs every
// registered suite, or those whose name starts
// with the prefix given on the command line.

namespace test_suite {

struct any_suite
{
    virtual ~any_suite() = default;
    virtual char const* name() const noexcept = 0;
    virtual void run() const = 0;
};

void insert(any_suite const* s);

template<class T>
class suite : public any_suite
{
    char const* name_;

public:
    explicit
    suite(char const* name) noexcept
        : name_(name)
    {
        insert(this);
    }

    char const*
    name() const noexcept override
    {
        return name_;
    }

    void
    run() const override
    {
        T().run();
    }
};

} // test_suite

#define TEST_SUITE(type, name) \
    static ::test_suite::suite<type> type##_instance(name)

#endif
