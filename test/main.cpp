//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test runner entry point, shared by all test executables

#define BOOST_TEST_MODULE chatstore
#include <boost/test/included/unit_test.hpp>
