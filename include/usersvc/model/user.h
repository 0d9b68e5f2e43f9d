#pragma once
/**
 * @file user.h
 * @brief User data model (with JSON serialization).
 *
 * Fields:
 *  - id:         store-generated primary key
 *  - username:   unique login name
 *  - email:      unique address
 *  - full_name:  display name
 *  - created_at / updated_at: always empty, serialized as null
 */
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace usersvc {

struct User {
    int32_t id{0};
    std::string username;
    std::string email;
    std::string full_name;
    std::optional<std::string> created_at;
    std::optional<std::string> updated_at;
};

// ordered_json keeps keys in declaration order on the wire.
using json = nlohmann::ordered_json;

inline json optional_json(const std::optional<std::string>& v){
    return v ? json(*v) : json(nullptr);
}

inline void to_json(json& j, const User& u){
    j = json::object();
    j["id"] = u.id;
    j["username"] = u.username;
    j["email"] = u.email;
    j["full_name"] = u.full_name;
    j["created_at"] = optional_json(u.created_at);
    j["updated_at"] = optional_json(u.updated_at);
}

} // namespace usersvc
