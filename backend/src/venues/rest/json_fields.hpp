#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

// Venues send numbers both as JSON numbers and as decimal strings; empty
// strings mean absent.
inline std::optional<double> json_number(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_number()) {
        return it->get<double>();
    }
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        if (s.empty()) {
            return std::nullopt;
        }
        try {
            return std::stod(s);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

inline std::optional<std::int64_t> json_int(const nlohmann::json& j, const char* key) {
    auto v = json_number(j, key);
    if (!v) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(*v);
}

inline std::string json_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

// Body parsed leniently: invalid JSON yields a discarded value.
inline nlohmann::json parse_body(const std::string& body) {
    return nlohmann::json::parse(body, nullptr, false);
}
