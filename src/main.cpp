//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "cli.hpp"
#include "config.hpp"
#include "error.hpp"
#include "services/chat_store.hpp"

namespace asio = boost::asio;
using namespace chatstore;

namespace {

[[noreturn]] void usage_error(const char* program)
{
    print_usage(std::cerr, program);
    exit(EXIT_FAILURE);
}

// Runs the command, prints its output and stops background tasks
asio::awaitable<void> run(chat_store& store, std::vector<std::string_view> args, int& exit_code)
{
    auto res = co_await run_command(store, std::move(args));
    if (res.has_error())
    {
        log_error(res.error(), "Running command");
        exit_code = EXIT_FAILURE;
    }
    else if (!res->empty())
    {
        std::cout << *res << std::endl;
    }

    // Stop the connection pool, if any, so that run() returns
    store.cancel();
}

int main_impl(int argc, char* argv[])
{
    // Check command line arguments.
    std::vector<std::string_view> args(argv + 1, argv + argc);
    if (!check_command_line(args))
        usage_error(argv[0]);

    // Application config
    auto cfg = load_store_config();
    if (cfg.has_error())
    {
        log_error(cfg.error(), "Loading configuration");
        exit(EXIT_FAILURE);
    }

    // The default database lives in the data directory, which may not exist yet
    if (cfg->backend == backend_type::sqlite && cfg->sqlite.path != ":memory:")
    {
        auto dir = std::filesystem::path(cfg->sqlite.path).parent_path();
        if (!dir.empty())
            std::filesystem::create_directories(dir);
    }

    // An event loop, where the application will run. The tool is single-
    // threaded, so we set the concurrency hint to 1
    asio::io_context ctx(1);

    // The store
    auto store = create_chat_store(*cfg, ctx.get_executor());
    if (store.has_error())
    {
        log_error(store.error(), "Opening the store");
        exit(EXIT_FAILURE);
    }

    // Launch the MySQL connection pool, if any
    (*store)->start_run();

    int exit_code = EXIT_SUCCESS;
    asio::co_spawn(
        // The execution context to run the coroutine on
        ctx,

        // The actual coroutine to run, as an awaitable
        run(**store, std::move(args), exit_code),

        // Will run when the coroutine finishes. Propagate any exceptions thrown
        // in the coroutine to main
        [](std::exception_ptr exc) {
            if (exc)
                std::rethrow_exception(exc);
        }
    );

    // Run the io_context. This will block until the command completes
    ctx.run();

    return exit_code;
}

}  // namespace

int main(int argc, char* argv[])
{
    try
    {
        return main_impl(argc, argv);
    }
    catch (const std::exception& err)
    {
        std::cerr << "Exception in main(): " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
}
