/*
 * File: tests/test_config.cpp
 * Project: Users Service
 * Purpose: Bind address parsing
 * Last updated: 2026-10-17
 */

#include <catch2/catch_all.hpp>
#include "users_config.hpp"


TEST_CASE("host:port splits on the last colon"){
auto [host, port] = split_host_port("0.0.0.0:3000");
REQUIRE(host=="0.0.0.0"); REQUIRE(port==3000);
REQUIRE(split_host_port("127.0.0.1:65535").second==65535);
REQUIRE(split_host_port("::1:8080").first=="::1");
}

TEST_CASE("out of range or malformed ports are rejected"){
auto bind = GENERATE(as<std::string>{}, "0.0.0.0:70000", "0.0.0.0:-1", "0.0.0.0:0", "0.0.0.0:",
                     "0.0.0.0", "0.0.0.0:30x", "0.0.0.0:99999999999999999999999");
REQUIRE_THROWS_AS(split_host_port(bind), std::invalid_argument);
}
