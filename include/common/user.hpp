/*
 * File: include/common/user.hpp
 * Project: Users Service
 * Purpose: User record, JSON form and in-memory store
 * Notes:
 *  - Store is process-local; a restart drops every user
 *  - Error bodies are {"error": "..."}; see src/users_http.hpp
 * Last updated: 2026-10-17
 */

#pragma once
#include <algorithm>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>


struct User {
std::string id;
std::string name;
std::string email;
};


inline nlohmann::json user_to_json(const User& user){
return nlohmann::json{
{"id", user.id},
{"name", user.name},
{"email", user.email}
};
}


// Insertion-ordered; ids are unique so the first match is the only match.
class UserStore {
mutable std::mutex m_;
std::vector<User> users_;

std::vector<User>::iterator locate(const std::string& id){
return std::find_if(users_.begin(), users_.end(), [&](const User& u){ return u.id == id; });
}

public:
void add(User u){ std::scoped_lock lk(m_); users_.push_back(std::move(u)); }

std::optional<User> find_by_id(const std::string& id) const {
std::scoped_lock lk(m_);
for (const auto& u : users_) if (u.id == id) return u;
return std::nullopt;
}

std::optional<User> replace(const std::string& id, std::string name, std::string email){
std::scoped_lock lk(m_);
auto it = locate(id);
if (it == users_.end()) return std::nullopt;
it->name = std::move(name);
it->email = std::move(email);
return *it;
}

bool remove_by_id(const std::string& id){
std::scoped_lock lk(m_);
auto it = locate(id);
if (it == users_.end()) return false;
users_.erase(it);
return true;
}

size_t size() const { std::scoped_lock lk(m_); return users_.size(); }
};
