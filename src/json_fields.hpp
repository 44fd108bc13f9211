/*
 * m4brew - Audiobook job orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>

#include <nlohmann/json.hpp>

namespace m4brew {

// Reads j[key] as T; anything missing, null or of the wrong type yields
// fallback.
template <typename T>
T field(const nlohmann::json& j, const char* key, T fallback) noexcept {
    try {
        if (j.is_object()) {
            auto it = j.find(key);
            if (it != j.end() && !it->is_null()) {
                return it->template get<T>();
            }
        }
    } catch (const nlohmann::json::exception&) {
        // wrong type
    }
    return fallback;
}

template <typename T>
std::optional<T> optionalField(const nlohmann::json& j, const char* key) noexcept {
    try {
        if (j.is_object()) {
            auto it = j.find(key);
            if (it != j.end() && !it->is_null()) {
                return it->template get<T>();
            }
        }
    } catch (const nlohmann::json::exception&) {
        // wrong type
    }
    return std::nullopt;
}

}
