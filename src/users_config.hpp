/*
 * File: src/users_config.hpp
 * Project: Users Service
 * Purpose: Command-line / environment bind address parsing
 * Last updated: 2026-10-17
 */

#pragma once
#include <stdexcept>
#include <string>
#include <utility>

// "host:port" -> {host, port}; port must be 1..65535.
inline std::pair<std::string, unsigned short> split_host_port(const std::string &s)
{
    auto p = s.rfind(':');
    if (p == std::string::npos || p + 1 == s.size())
        throw std::invalid_argument("expected host:port, got " + s);
    const std::string port_str = s.substr(p + 1);
    if (port_str.find_first_not_of("0123456789") != std::string::npos)
        throw std::invalid_argument("port is not a number: " + port_str);
    unsigned long port = 0;
    try
    {
        port = std::stoul(port_str);
    }
    catch (const std::out_of_range &)
    {
        throw std::invalid_argument("port out of range: " + port_str);
    }
    if (port < 1 || port > 65535)
        throw std::invalid_argument("port out of range: " + port_str);
    return {s.substr(0, p), static_cast<unsigned short>(port)};
}
