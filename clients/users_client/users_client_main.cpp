/*
 * File: clients/users_client/users_client_main.cpp
 * Project: Users Service
 * Purpose: Example HTTP consumer client: create, read, update, delete one user
 * Notes:
 *  - Expects users_server on --http (default http://localhost:3000)
 * Last updated: 2026-10-17
 */

#include <iostream>
#include <optional>
#include <boost/asio.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/core/flat_buffer.hpp>

#include <nlohmann/json.hpp>

namespace http = boost::beast::http;
using json = nlohmann::json;

struct Exchange
{
    unsigned status = 0;
    std::string body;
};

static Exchange call(boost::asio::io_context &ioc,
                     const boost::asio::ip::tcp::resolver::results_type &results,
                     const std::string &host,
                     http::verb verb, const std::string &target,
                     const std::optional<json> &payload = std::nullopt)
{
    boost::asio::ip::tcp::socket sock{ioc};
    boost::asio::connect(sock, results.begin(), results.end());
    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, host);
    if (payload)
    {
        req.set(http::field::content_type, "application/json");
        req.body() = payload->dump();
    }
    req.prepare_payload();
    http::write(sock, req);
    boost::beast::flat_buffer buf;
    http::response<http::string_body> res;
    http::read(sock, buf, res);

    boost::system::error_code ignored;
    sock.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    return {res.result_int(), res.body()};
}

static void print(const char *what, const Exchange &ex, bool pretty)
{
    std::cout << "[users_client] " << what << " status=" << ex.status;
    if (ex.body.empty())
    {
        std::cout << " (no body)" << std::endl;
        return;
    }
    auto j = json::parse(ex.body, nullptr, false);
    if (j.is_discarded())
        std::cout << " raw body=" << ex.body << std::endl;
    else
        std::cout << " body:\n" << (pretty ? j.dump(2) : j.dump()) << std::endl;
}

int main(int argc, char **argv)
{
    bool pretty = false;
    std::string base = "http://localhost:3000";
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--http" && i + 1 < argc)
            base = argv[++i];
        else if (a == "--pretty")
            pretty = true;
    }

    try
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto pos = base.find("//");
        auto hp = (pos == std::string::npos) ? base : base.substr(pos + 2);
        auto colon = hp.find(':');
        auto host = hp.substr(0, colon);
        auto port = (colon == std::string::npos) ? std::string("80") : hp.substr(colon + 1);
        auto results = res.resolve(host, port);

        auto created = call(ioc, results, host, http::verb::post, "/users",
                            json{{"name", "Ada"}, {"email", "ada@x.com"}});
        print("POST /users", created, pretty);
        if (created.status != 201)
            return 1;
        const std::string id = json::parse(created.body).at("id").get<std::string>();
        const std::string target = "/users/" + id;

        print("GET", call(ioc, results, host, http::verb::get, target), pretty);
        print("PUT", call(ioc, results, host, http::verb::put, target,
                          json{{"name", "Ada L."}, {"email", "ada@x.com"}}),
              pretty);
        print("DELETE", call(ioc, results, host, http::verb::delete_, target), pretty);
        print("GET after delete", call(ioc, results, host, http::verb::get, target), pretty);
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "users_client error: " << e.what() << "\n";
        return 1;
    }
}
