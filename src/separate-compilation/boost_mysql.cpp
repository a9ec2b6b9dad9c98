//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Separate compilation for Boost.MySQL. Requires
// BOOST_MYSQL_SEPARATE_COMPILATION to be defined for all files.

#include <boost/mysql/src.hpp>
