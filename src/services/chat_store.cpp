//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/chat_store.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <memory>

#include "business_types.hpp"
#include "config.hpp"
#include "error.hpp"

using namespace chatstore;

error_code chatstore::validate_timeline_query(const timeline_query& query) noexcept
{
    if (query.limit == 0u || query.limit > timeline_query::max_limit)
        return errc::invalid_argument;
    return error_code();
}

result_with_message<std::unique_ptr<chat_store>> chatstore::create_chat_store(
    const store_config& cfg,
    boost::asio::any_io_executor ex
)
{
    switch (cfg.backend)
    {
    case backend_type::mysql: return create_mysql_store(cfg.mysql, std::move(ex));
    case backend_type::sqlite:
    default: return create_sqlite_store(cfg.sqlite, std::move(ex));
    }
}
