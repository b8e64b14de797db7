/*
 * File: src/users_state.hpp
 * Project: Users Service
 * Purpose: Internal support module
 * Notes:
 *  - Store is process-local; a restart drops every user
 *  - Error bodies are {"error": "..."}; see src/users_http.hpp
 * Last updated: 2026-10-17
 */

#pragma once
#include <memory>
#include <string>
#include "common/user.hpp"
#include "common/id_generator.hpp"


struct UsersState {
UserStore users;
std::unique_ptr<IdGenerator> ids = std::make_unique<UuidGenerator>();
bool access_log = true;

UsersState() = default;
explicit UsersState(std::unique_ptr<IdGenerator> g, bool log = true) : ids(std::move(g)), access_log(log) {}
};
