//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/safestring
//

#include "test_suite.hpp"

#include <cstring>
#include <iostream>
#include <vector>

namespace test_suite {

namespace {

std::vector<any_suite const*>&
suites()
{
    static std::vector<any_suite const*> v;
    return v;
}

} // (anon)

void
insert(any_suite const* s)
{
    suites().push_back(s);
}

} // test_suite

int
main(int argc, char** argv)
{
    char const* prefix = argc > 1 ? argv[1] : "";
    auto const n = std::strlen(prefix);
    for(auto s : test_suite::suites())
    {
        if(std::strncmp(s->name(), prefix, n) != 0)
            continue;
        std::cout << s->name() << std::endl;
        s->run();
    }
    return boost::report_errors();
}
