/**
 * Arena Tracker - JSON field accessors
 *
 * Small helpers for reading loosely-shaped payloads. Absent and null fields
 * yield the default; a present field of the wrong type throws (json type_error
 * for scalars, std::invalid_argument for containers) so the caller never sees
 * a half-read value.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace arena {
namespace json_fields {

inline const nlohmann::json& empty_object() {
    static const nlohmann::json empty = nlohmann::json::object();
    return empty;
}

inline const nlohmann::json& empty_array() {
    static const nlohmann::json empty = nlohmann::json::array();
    return empty;
}

inline bool has(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return false;
    auto it = obj.find(key);
    return it != obj.end() && !it->is_null();
}

inline const nlohmann::json& object_or_empty(const nlohmann::json& obj, const char* key) {
    if (!has(obj, key)) return empty_object();
    const auto& child = obj.at(key);
    if (!child.is_object()) {
        throw std::invalid_argument(std::string("field '") + key + "' is not an object");
    }
    return child;
}

inline const nlohmann::json& array_or_empty(const nlohmann::json& obj, const char* key) {
    if (!has(obj, key)) return empty_array();
    const auto& child = obj.at(key);
    if (!child.is_array()) {
        throw std::invalid_argument(std::string("field '") + key + "' is not an array");
    }
    return child;
}

template <typename T>
std::optional<T> optional_value(const nlohmann::json& obj, const char* key) {
    if (!has(obj, key)) return std::nullopt;
    return obj.at(key).get<T>();
}

inline std::string string_or(const nlohmann::json& obj, const char* key,
                             const std::string& fallback = "") {
    if (!has(obj, key)) return fallback;
    return obj.at(key).get<std::string>();
}

inline int int_or(const nlohmann::json& obj, const char* key, int fallback = 0) {
    if (!has(obj, key)) return fallback;
    return obj.at(key).get<int>();
}

} // namespace json_fields
} // namespace arena
