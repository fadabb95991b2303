#pragma once

#include "classifier/entity_patterns.hpp"
#include "core/iname_recognizer.hpp"
#include "core/types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace promptguard {

/**
 * @brief Reversible prompt masking engine
 *
 * mask():   replaces sensitive spans with typed placeholders "[CATEGORY_N]"
 *           and returns the placeholder -> original mapping.
 * unmask(): substitutes the originals back into any text carrying those
 *           placeholders (typically a model reply to the masked prompt).
 *
 * Passes run in EntityPatternRegistry rule order, then NAME via the injected
 * recognizer. Placeholder indices start at 0 per category on every call and
 * follow left-to-right discovery order within a pass.
 *
 * All per-call state lives on the stack of mask(); one instance may be
 * shared across threads.
 */
class PromptMasker {
public:
    struct Config {
        bool log_detections = false;   // info-log category + placeholder (never the original)
    };

    /// Built-in patterns, no name recognition
    PromptMasker();

    explicit PromptMasker(
        std::shared_ptr<const EntityPatternRegistry> registry,
        std::shared_ptr<const INameRecognizer> name_recognizer = nullptr);

    PromptMasker(
        std::shared_ptr<const EntityPatternRegistry> registry,
        std::shared_ptr<const INameRecognizer> name_recognizer,
        Config config);

    /**
     * @brief Mask sensitive spans in text. Never fails.
     */
    [[nodiscard]] MaskingResult mask(std::string_view text) const;

    /**
     * @brief Replace every occurrence of every mapping key with its value
     *
     * Single left-to-right scan, longest key first at each position, so the
     * result does not depend on map iteration order and restored values are
     * never rescanned. Keys absent from the text are ignored.
     */
    [[nodiscard]] static std::string unmask(
        std::string_view text, const PlaceholderMapping& mappings);

    /// "[CATEGORY_N]"
    [[nodiscard]] static std::string make_placeholder(EntityCategory category, size_t index);

    [[nodiscard]] bool name_recognition_enabled() const;

    [[nodiscard]] const EntityPatternRegistry& registry() const { return *registry_; }

private:
    class Session;

    void apply_pattern_rules(Session& session) const;
    void apply_name_recognition(Session& session) const;

    /// Drop out-of-range, inconsistent, overlapping and placeholder-touching spans
    [[nodiscard]] static std::vector<PatternMatch> validate_name_spans(
        std::vector<NameSpan> spans, const Session& session);

    std::shared_ptr<const EntityPatternRegistry> registry_;
    std::shared_ptr<const INameRecognizer> name_recognizer_;
    Config config_;
};

} // namespace promptguard
