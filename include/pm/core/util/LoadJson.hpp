// LoadJson.hpp - JSON loading and typed access for parameter files
#pragma once

#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <string>
#include <vector>

#include "pm/core/Errors.hpp"

namespace pm::json {

inline nlohmann::json load_json_file(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        throw InvalidInputError("JSON file not found: " + path.string());
    }
    std::ifstream file(path);
    if (!file) {
        throw InvalidInputError("Cannot open JSON file: " + path.string());
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidInputError("Invalid JSON in " + path.string() + ": " + e.what());
    }
}

// ============ VALIDATION ============

// Reject keys that no reader knows about, they are usually typos
inline void reject_unknown_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> known,
    const std::string& context)
{
    for (auto it = json.begin(); it != json.end(); ++it) {
        bool found = false;
        for (const char* key : known) {
            if (it.key() == key) {
                found = true;
                break;
            }
        }
        if (!found) {
            throw InvalidArgumentError(context + " has unknown field: " + it.key());
        }
    }
}

// ============ TYPED ACCESS HELPERS ============
// Missing keys give def, present keys of the wrong type throw InvalidArgumentError.

inline int64_t integer_or(const nlohmann::json& m, const char* key, int64_t def, const std::string& context)
{
    auto it = m.find(key);
    if (it == m.end()) return def;
    const std::string field = context + " field '" + std::string(key) + "'";
    if (it->is_number_unsigned()) {
        const uint64_t u = it->get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw InvalidArgumentError(field + " is out of range: " + std::to_string(u));
        }
        return static_cast<int64_t>(u);
    }
    if (it->is_number_integer()) return it->get<int64_t>();
    // 8.0 is accepted, 8.5 is not
    if (it->is_number_float()) {
        const double v = it->get<double>();
        if (std::isfinite(v) && std::floor(v) == v) {
            // [-2^63, 2^63) converts exactly, anything outside does not fit
            const double limit = std::ldexp(1.0, 63);
            if (v < -limit || v >= limit) {
                throw InvalidArgumentError(field + " is out of range: " + it->dump());
            }
            return static_cast<int64_t>(v);
        }
    }
    throw InvalidArgumentError(field + " must be an integer");
}

inline bool bool_or(const nlohmann::json& m, const char* key, bool def, const std::string& context)
{
    auto it = m.find(key);
    if (it == m.end()) return def;
    if (!it->is_boolean()) {
        throw InvalidArgumentError(context + " field '" + std::string(key) + "' must be true or false");
    }
    return it->get<bool>();
}

inline std::string string_or(const nlohmann::json& m, const char* key, const std::string& def,
                             const std::string& context)
{
    auto it = m.find(key);
    if (it == m.end()) return def;
    if (!it->is_string()) {
        throw InvalidArgumentError(context + " field '" + std::string(key) + "' must be a string");
    }
    return it->get<std::string>();
}

inline std::vector<std::string> string_list_or(const nlohmann::json& m, const char* key,
                                               const std::vector<std::string>& def,
                                               const std::string& context)
{
    auto it = m.find(key);
    if (it == m.end()) return def;
    if (it->is_string()) return {it->get<std::string>()};
    if (!it->is_array()) {
        throw InvalidArgumentError(context + " field '" + std::string(key) + "' must be a list of strings");
    }
    std::vector<std::string> out;
    for (const auto& item : *it) {
        if (!item.is_string()) {
            throw InvalidArgumentError(context + " field '" + std::string(key) + "' must be a list of strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace pm::json
