//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// This file enables separate compilation for Boost.Asio, reducing
// build times for the other files. Boost.MySQL uses Asio's SSL streams,
// so these are compiled here, too.

#include <boost/asio/impl/src.hpp>
#include <boost/asio/ssl/impl/src.hpp>
