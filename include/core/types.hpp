#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace promptguard {

// ============================================================================
// Entity Categories
// ============================================================================

/**
 * @brief Sensitive-information classes detected by the masker.
 *
 * Enumerator order is the order of the masking passes.
 */
enum class EntityCategory : uint8_t {
    MENTAL_HEALTH,
    DISEASE,
    EMAIL,
    PHONE,
    AGE,
    LOCATION,
    GENDER,
    NAME
};

inline constexpr size_t kEntityCategoryCount = 8;

inline constexpr std::array<EntityCategory, kEntityCategoryCount> kAllCategories = {
    EntityCategory::MENTAL_HEALTH,
    EntityCategory::DISEASE,
    EntityCategory::EMAIL,
    EntityCategory::PHONE,
    EntityCategory::AGE,
    EntityCategory::LOCATION,
    EntityCategory::GENDER,
    EntityCategory::NAME,
};

// ============================================================================
// Mapping & Results
// ============================================================================

/// Placeholder token -> original substring
using PlaceholderMapping = std::unordered_map<std::string, std::string>;

/**
 * @brief A person-name span reported by a name recognizer.
 *
 * Offsets are byte offsets into the text handed to the recognizer,
 * half-open: [start, end).
 */
struct NameSpan {
    size_t start = 0;
    size_t end = 0;
    std::string text;

    NameSpan() = default;
    NameSpan(size_t s, size_t e, std::string t)
        : start(s), end(e), text(std::move(t)) {}
};

/**
 * @brief Output of one mask call. Immutable once returned.
 */
struct MaskingResult {
    std::string original_text;
    std::string masked_text;
    PlaceholderMapping mappings;
    std::vector<std::string> detected_entities;   // "<CATEGORY>: <original>"

    [[nodiscard]] bool has_detections() const { return !mappings.empty(); }
};

// ============================================================================
// Utility Functions
// ============================================================================

inline const char* category_to_string(EntityCategory category) {
    switch (category) {
        case EntityCategory::MENTAL_HEALTH: return "MENTAL_HEALTH";
        case EntityCategory::DISEASE: return "DISEASE";
        case EntityCategory::EMAIL: return "EMAIL";
        case EntityCategory::PHONE: return "PHONE";
        case EntityCategory::AGE: return "AGE";
        case EntityCategory::LOCATION: return "LOCATION";
        case EntityCategory::GENDER: return "GENDER";
        case EntityCategory::NAME: return "NAME";
        default: return "UNKNOWN";
    }
}

inline std::optional<EntityCategory> category_from_string(std::string_view name) {
    for (const auto category : kAllCategories) {
        if (name == category_to_string(category)) {
            return category;
        }
    }
    return std::nullopt;
}

[[nodiscard]] inline constexpr size_t category_index(EntityCategory category) noexcept {
    return static_cast<size_t>(category);
}

} // namespace promptguard
