#pragma once
// ═══════════════════════════════════════════════════════════════════
//  dlproxy/json_utils.h — JSON serialization helpers
// ═══════════════════════════════════════════════════════════════════
//  Uses nlohmann/json + C++20 Concepts. JSON is used for the config
//  file and for the framework's own error bodies; proxied payloads
//  are never parsed.
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <concepts>
#include <string>
#include <vector>

namespace dlproxy {

// ─────────────────────────────────────────────
//  Macro: DLPROXY_SERIALIZE
//  Makes a struct convertible to and from JSON.
//
//  Usage:
//    struct Limits {
//        int maxRedirects;
//        DLPROXY_SERIALIZE(Limits, maxRedirects)
//    };
// ─────────────────────────────────────────────
#define DLPROXY_SERIALIZE(Type, ...) \
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Type, __VA_ARGS__)

// ─────────────────────────────────────────────
//  Concept: JsonSerializable
//  Any type T that nlohmann::json can construct from.
// ─────────────────────────────────────────────
template <typename T>
concept JsonSerializable = requires(T t) {
    { nlohmann::json(t) } -> std::convertible_to<nlohmann::json>;
};

// ── Keys of `patch` that do not exist in `reference` (top level only) ──
inline std::vector<std::string> unknownKeys(const nlohmann::json& reference,
                                            const nlohmann::json& patch) {
    std::vector<std::string> unknown;
    if (!patch.is_object()) return unknown;
    for (auto it = patch.begin(); it != patch.end(); ++it) {
        if (!reference.contains(it.key())) unknown.push_back(it.key());
    }
    return unknown;
}

template <JsonSerializable T>
inline nlohmann::json toJson(const T& value) {
    return nlohmann::json(value);
}

template <typename T>
inline T fromJson(const nlohmann::json& j) {
    return j.get<T>();
}

} // namespace dlproxy
