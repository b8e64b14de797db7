/*
 * File: src/users_http.hpp
 * Project: Users Service
 * Purpose: HTTP routing and handlers
 * Notes:
 *  - Store is process-local; a restart drops every user
 *  - Error bodies are {"error": "..."}
 *  - handle_request() is transport-free; HttpServer only moves bytes
 * Last updated: 2026-10-17
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>

#include <nlohmann/json.hpp>

#include <cctype>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "users_state.hpp"
#include "common/user.hpp" // User, UserStore, user_to_json

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// -------- errors --------

struct ValidationError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// -------- request body --------

// Fields are set only when the body carried them as JSON strings.
struct UserFields
{
    std::optional<std::string> name;
    std::optional<std::string> email;
};

inline bool is_json_content(const HttpRequest &req)
{
    auto it = req.find(http::field::content_type);
    if (it == req.end())
        return false;
    std::string ct(it->value());
    auto semi = ct.find(';');
    if (semi != std::string::npos)
        ct.resize(semi);
    while (!ct.empty() && ct.back() == ' ')
        ct.pop_back();
    for (auto &c : ct)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return ct == "application/json";
}

// Throws nlohmann::json::parse_error on a malformed JSON body.
inline UserFields parse_user_fields(const HttpRequest &req)
{
    UserFields f;
    if (!is_json_content(req) || req.body().empty())
        return f;

    auto body = nlohmann::json::parse(req.body());
    if (!body.is_object())
        return f;

    // Non-string values count as absent, so {"name":42} is a 400 rather than a stored number.
    auto take = [&](const char *key, std::optional<std::string> &out)
    {
        auto it = body.find(key);
        if (it != body.end() && it->is_string())
            out = it->get<std::string>();
    };
    take("name", f.name);
    take("email", f.email);
    return f;
}

// Empty counts as missing.
inline std::pair<std::string, std::string> require_fields(const UserFields &f)
{
    if (!f.name || f.name->empty() || !f.email || f.email->empty())
        throw ValidationError("name and email are required");
    return {*f.name, *f.email};
}

// -------- routing helpers --------

// Control bytes become \xHH so a target cannot split an access log line.
inline std::string printable(const std::string &s)
{
    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
    {
        if (c < 0x20 || c == 0x7f)
        {
            out += "\\x";
            out += hex[c >> 4];
            out += hex[c & 0xf];
        }
        else
            out += static_cast<char>(c);
    }
    return out;
}

inline std::string path_of(const HttpRequest &req)
{
    std::string target(req.target());
    auto q = target.find('?');
    return (q == std::string::npos) ? target : target.substr(0, q);
}

// "/users/<id>" or "/users/<id>/" -> id
inline std::optional<std::string> user_id_from_path(const std::string &path)
{
    static const std::string prefix = "/users/";
    if (path.rfind(prefix, 0) != 0)
        return std::nullopt;
    std::string id = path.substr(prefix.size());
    if (!id.empty() && id.back() == '/')
        id.pop_back();
    if (id.empty() || id.find('/') != std::string::npos)
        return std::nullopt;
    return id;
}

inline HttpResponse json_response(http::status status, const nlohmann::json &body, unsigned version)
{
    HttpResponse res{status, version};
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

inline HttpResponse error_response(http::status status, const std::string &message, unsigned version)
{
    return json_response(status, nlohmann::json{{"error", message}}, version);
}

// -------- handlers --------

inline HttpResponse create_user(const HttpRequest &req, UsersState &state)
{
    auto [name, email] = require_fields(parse_user_fields(req));
    User user{state.ids->next_id(), std::move(name), std::move(email)};
    state.users.add(user);
    return json_response(http::status::created, user_to_json(user), req.version());
}

inline HttpResponse get_user(const HttpRequest &req, UsersState &state, const std::string &id)
{
    auto user = state.users.find_by_id(id);
    if (!user)
        throw NotFoundError("user not found");
    return json_response(http::status::ok, user_to_json(*user), req.version());
}

// Field presence is checked before the id lookup.
inline HttpResponse update_user(const HttpRequest &req, UsersState &state, const std::string &id)
{
    auto [name, email] = require_fields(parse_user_fields(req));
    auto user = state.users.replace(id, std::move(name), std::move(email));
    if (!user)
        throw NotFoundError("user not found");
    return json_response(http::status::ok, user_to_json(*user), req.version());
}

inline HttpResponse delete_user(const HttpRequest &req, UsersState &state, const std::string &id)
{
    if (!state.users.remove_by_id(id))
        throw NotFoundError("user not found");
    HttpResponse res{http::status::no_content, req.version()};
    res.prepare_payload();
    return res;
}

inline HttpResponse root(const HttpRequest &req)
{
    HttpResponse res{http::status::ok, req.version()};
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.body() = "Hello World!";
    res.prepare_payload();
    return res;
}

inline HttpResponse route(const HttpRequest &req, UsersState &state)
{
    const std::string path = path_of(req);
    const auto method = req.method();

    // GET /
    if (method == http::verb::get && path == "/")
        return root(req);

    // POST /users
    if (method == http::verb::post && (path == "/users" || path == "/users/"))
        return create_user(req, state);

    // GET|PUT|DELETE /users/:id
    if (auto id = user_id_from_path(path))
    {
        if (method == http::verb::get)
            return get_user(req, state, *id);
        if (method == http::verb::put)
            return update_user(req, state, *id);
        if (method == http::verb::delete_)
            return delete_user(req, state, *id);
    }

    // 404 fallback
    return error_response(http::status::not_found, "not found", req.version());
}

// Never throws: every failure becomes a structured response.
inline HttpResponse handle_request(const HttpRequest &req, UsersState &state)
{
    try
    {
        return route(req, state);
    }
    catch (const ValidationError &e)
    {
        return error_response(http::status::bad_request, e.what(), req.version());
    }
    catch (const NotFoundError &e)
    {
        return error_response(http::status::not_found, e.what(), req.version());
    }
    catch (const nlohmann::json::parse_error &)
    {
        return error_response(http::status::bad_request, "bad json", req.version());
    }
    catch (const std::exception &e)
    {
        std::cerr << "ERROR: " << req.method_string() << " " << printable(std::string(req.target())) << ": " << e.what() << "\n";
        return json_response(http::status::internal_server_error,
                             nlohmann::json{{"error", "internal error"}, {"what", e.what()}}, req.version());
    }
}

// -------- HTTP server --------

class HttpServer
{
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::socket socket_;
    UsersState &state_;

public:
    // Throws boost::system::system_error if the endpoint cannot be bound.
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, UsersState &s)
        : acceptor_(ioc), socket_(ioc), state_(s)
    {
        acceptor_.open(ep.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
        do_accept();
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

private:
    void do_accept()
    {
        acceptor_.async_accept(socket_, [this](auto ec)
                               {
            if (!ec) std::make_shared<Session>(std::move(socket_), state_)->run();
            else if (ec != boost::asio::error::operation_aborted)
                std::cerr << "WARN: accept failed: " << ec.message() << "\n";
            if (acceptor_.is_open()) do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        HttpRequest req;
        UsersState &state;

        Session(boost::asio::ip::tcp::socket &&s, UsersState &st)
            : socket(std::move(s)), state(st) {}

        void run() { do_read(); }

        void do_read()
        {
            auto self = shared_from_this();
            http::async_read(socket, buffer, req, [self](auto ec, auto)
                             {
                if (!ec) self->handle(); });
        }

        // one request per connection; response kept alive through async_write
        void respond(HttpResponse &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<HttpResponse>(std::move(res));
            sp->set(http::field::server, "users-beast");
            sp->keep_alive(false);

            http::async_write(socket, *sp, [self, sp](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ignored;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }

        void handle()
        {
            auto res = handle_request(req, state);
            if (state.access_log)
                std::cout << "[http] " << req.method_string() << " " << printable(std::string(req.target()))
                          << " -> " << res.result_int() << "\n";
            respond(std::move(res));
        }
    };
};
