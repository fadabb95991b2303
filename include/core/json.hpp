#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace promptguard {

/**
 * @brief MaskingResult -> {"original_text", "masked_text", "mappings", "detected_entities"}
 *
 * Found by nlohmann::json through ADL, so `nlohmann::json j = result;` works.
 */
inline void to_json(nlohmann::json& j, const MaskingResult& result) {
    j = nlohmann::json{
        {"original_text", result.original_text},
        {"masked_text", result.masked_text},
        {"mappings", result.mappings},
        {"detected_entities", result.detected_entities},
    };
}

/**
 * @brief Read a placeholder mapping from a JSON object of strings
 * @return nullopt if `j` is not an object or any value is not a string
 */
[[nodiscard]] inline std::optional<PlaceholderMapping> mapping_from_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    PlaceholderMapping mapping;
    mapping.reserve(j.size());
    for (const auto& [key, value] : j.items()) {
        if (!value.is_string()) return std::nullopt;
        mapping.emplace(key, value.get<std::string>());
    }
    return mapping;
}

/// Serialize for output; invalid UTF-8 in user text becomes U+FFFD instead of throwing
[[nodiscard]] inline std::string dump_lenient(const nlohmann::json& j, int indent = -1) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace promptguard
