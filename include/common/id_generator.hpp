/*
 * File: include/common/id_generator.hpp
 * Project: Users Service
 * Purpose: Pluggable user id source
 * Notes:
 *  - Store is process-local; a restart drops every user
 *  - Error bodies are {"error": "..."}; see src/users_http.hpp
 * Last updated: 2026-10-17
 */

#pragma once
#include <mutex>
#include <string>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>


class IdGenerator {
public:
virtual ~IdGenerator() = default;
virtual std::string next_id() = 0;
};


// Random (v4) UUIDs in canonical lowercase form, e.g. 1b4e28ba-2fa1-11d2-883f-0016d3cca427
class UuidGenerator : public IdGenerator {
std::mutex m_;
boost::uuids::random_generator gen_;
public:
std::string next_id() override {
std::scoped_lock lk(m_);
return boost::uuids::to_string(gen_());
}
};
