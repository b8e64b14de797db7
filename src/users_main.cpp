/*
 * File: src/users_main.cpp
 * Project: Users Service
 * Purpose: Main server binary: HTTP /users CRUD endpoints
 * Notes:
 *  - Store is process-local; a restart drops every user
 *  - USERS_ENV=test builds the router without opening a listener
 * Last updated: 2026-10-17
 */

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <boost/asio.hpp>
#include "users_config.hpp"
#include "users_http.hpp"
#include "users_state.hpp"

int main(int argc, char **argv)
{
    std::string http_bind = "0.0.0.0:3000";
    bool http_given = false;
    bool quiet = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--http" && i + 1 < argc)
        {
            http_bind = argv[++i];
            http_given = true;
        }
        else if (a == "--quiet")
            quiet = true;
    }
    // hosting environment may pick the port
    if (!http_given)
    {
        if (const char *port = std::getenv("PORT"); port && *port)
            http_bind = "0.0.0.0:" + std::string(port);
    }

    UsersState state;
    state.access_log = !quiet;

    if (const char *env = std::getenv("USERS_ENV"); env && std::string(env) == "test")
    {
        std::cout << "users: USERS_ENV=test, listener not started\n";
        return 0;
    }

    try
    {
        auto [http_host, http_port] = split_host_port(http_bind);

        boost::asio::io_context ioc{1};
        boost::asio::ip::tcp::endpoint http_ep{boost::asio::ip::make_address(http_host), http_port};
        HttpServer http{ioc, http_ep, state};

        std::cout << "users listening http=" << http_host << ":" << http.port() << std::endl;

        ioc.run();
    }
    catch (const std::exception &e)
    {
        std::cerr << "users error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
