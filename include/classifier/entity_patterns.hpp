#pragma once

#include "core/types.hpp"

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace promptguard {

/**
 * @brief One regex of a category rule, compiled once at registry construction.
 *
 * `regex` is empty when the source failed to compile; such a pattern
 * produces zero matches.
 */
struct CompiledPattern {
    std::string name;               // e.g. "phone_parenthesized"
    std::string source;
    std::optional<std::regex> regex;

    [[nodiscard]] bool is_valid() const { return regex.has_value(); }
};

/**
 * @brief All patterns for a category, run as consecutive passes in order
 */
struct CategoryRule {
    EntityCategory category;
    std::vector<CompiledPattern> patterns;
};

/// Half-open byte range [start, end) in the scanned text
struct PatternMatch {
    size_t start = 0;
    size_t end = 0;
};

/**
 * @brief Entity pattern registry - ordered category rules for the masker
 *
 * Rule order (fixed):
 * 1. MENTAL_HEALTH  vocabulary, whole word, case-insensitive
 * 2. DISEASE        vocabulary, whole word, case-insensitive
 * 3. EMAIL          structural pattern
 * 4. PHONE          10-digit, parenthesized area code, international
 * 5. AGE            "aged 30" / "30-year-old" forms, case-insensitive
 * 6. LOCATION       US cities + states + countries gazetteer
 * 7. GENDER         vocabulary, whole word, case-insensitive
 *
 * NAME has no pattern rule; it comes from an INameRecognizer.
 * The registry is immutable after construction and safe to share.
 */
class EntityPatternRegistry {
public:
    struct Config {
        // Additional vocabulary terms (MENTAL_HEALTH, DISEASE, LOCATION, GENDER)
        std::unordered_map<EntityCategory, std::vector<std::string>> extra_terms;
    };

    EntityPatternRegistry();
    explicit EntityPatternRegistry(const Config& config);

    [[nodiscard]] const std::vector<CategoryRule>& rules() const { return rules_; }

    /// Number of patterns that failed to compile (and are therefore inert)
    [[nodiscard]] size_t invalid_pattern_count() const;

    /**
     * @brief Find all non-overlapping matches, left to right
     *
     * A regex_error raised while matching is logged and yields no matches.
     */
    [[nodiscard]] static std::vector<PatternMatch> find_matches(
        const CompiledPattern& pattern, const std::string& text);

    /**
     * @brief Compile a pattern, logging and returning an inert pattern on failure
     */
    [[nodiscard]] static CompiledPattern compile(
        std::string name, std::string source,
        std::regex::flag_type flags = std::regex::ECMAScript);

    /**
     * @brief Build a whole-word alternation from literal terms
     *
     * Terms are deduplicated (case-insensitively unless `case_sensitive`,
     * which must match how the pattern is compiled) and ordered longest
     * first, so "Kansas City" wins over "Kansas". Returns "" for no terms.
     */
    [[nodiscard]] static std::string build_vocabulary_pattern(
        const std::vector<std::string>& terms, bool case_sensitive = false);

    /// Escape regex metacharacters so the term matches literally
    [[nodiscard]] static std::string escape_regex(std::string_view term);

    /// Built-in vocabulary for a vocabulary category (empty for others)
    [[nodiscard]] static const std::vector<std::string>& default_vocabulary(
        EntityCategory category);

    [[nodiscard]] static bool is_vocabulary_category(EntityCategory category);

private:
    void add_vocabulary_rule(EntityCategory category, const Config& config);

    std::vector<CategoryRule> rules_;
};

} // namespace promptguard
