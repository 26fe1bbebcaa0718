#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace conngraph {
namespace schema {

// Payloads written by older hosts use PascalCase keys
inline const nlohmann::json* findField(const nlohmann::json& j, const char* camel, const char* pascal) {
    auto it = j.find(camel);
    if (it != j.end()) return &*it;
    it = j.find(pascal);
    if (it != j.end()) return &*it;
    return nullptr;
}

inline std::string stringField(const nlohmann::json& j, const char* camel, const char* pascal,
                               const std::string& fallback) {
    const nlohmann::json* v = findField(j, camel, pascal);
    if (!v || v->is_null()) return fallback;
    return v->get<std::string>();
}

inline bool boolField(const nlohmann::json& j, const char* camel, const char* pascal, bool fallback) {
    const nlohmann::json* v = findField(j, camel, pascal);
    if (!v || v->is_null()) return fallback;
    return v->get<bool>();
}

} // namespace schema
} // namespace conngraph
