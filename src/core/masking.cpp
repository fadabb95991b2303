#include "core/masking.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <format>

namespace promptguard {

// ============================================================================
// Session - per-call counters, mapping and in-progress text
// ============================================================================

class PromptMasker::Session {
public:
    explicit Session(std::string_view text) : text_(text) {}

    [[nodiscard]] const std::string& text() const { return text_; }

    /**
     * @brief Replace sorted, non-overlapping spans of the current text
     *
     * Indices are assigned in span order (left to right); the output is
     * rebuilt in one forward pass so no span offset is invalidated.
     */
    void replace_spans(EntityCategory category,
                       const std::vector<PatternMatch>& spans,
                       bool log_detections) {
        if (spans.empty()) return;

        std::string rebuilt;
        rebuilt.reserve(text_.size() + spans.size() * 16);
        size_t cursor = 0;
        for (const auto& span : spans) {
            rebuilt.append(text_, cursor, span.start - cursor);

            std::string original = text_.substr(span.start, span.end - span.start);
            std::string placeholder = next_placeholder(category);
            if (log_detections) {
                utils::log::info(std::format("Masked {} span as {}",
                    category_to_string(category), placeholder));
            }
            detections_.push_back(std::format("{}: {}", category_to_string(category), original));
            rebuilt.append(placeholder);
            mappings_.insert_or_assign(std::move(placeholder), std::move(original));

            cursor = span.end;
        }
        rebuilt.append(text_, cursor, std::string::npos);
        text_ = std::move(rebuilt);
    }

    /// true if [start, end) touches any placeholder emitted by this session
    [[nodiscard]] bool overlaps_placeholder(size_t start, size_t end) const {
        for (const auto& [placeholder, original] : mappings_) {
            size_t pos = text_.find(placeholder);
            while (pos != std::string::npos) {
                if (pos < end && start < pos + placeholder.size()) {
                    return true;
                }
                pos = text_.find(placeholder, pos + 1);
            }
        }
        return false;
    }

    [[nodiscard]] MaskingResult finish(std::string_view original) && {
        MaskingResult result;
        result.original_text = std::string(original);
        result.masked_text = std::move(text_);
        result.mappings = std::move(mappings_);
        result.detected_entities = std::move(detections_);
        return result;
    }

private:
    std::string next_placeholder(EntityCategory category) {
        auto& counter = counters_[category_index(category)];
        return make_placeholder(category, counter++);
    }

    std::string text_;
    std::array<size_t, kEntityCategoryCount> counters_{};
    PlaceholderMapping mappings_;
    std::vector<std::string> detections_;
};

// ============================================================================
// PromptMasker
// ============================================================================

PromptMasker::PromptMasker()
    : PromptMasker(std::make_shared<EntityPatternRegistry>()) {}

PromptMasker::PromptMasker(
    std::shared_ptr<const EntityPatternRegistry> registry,
    std::shared_ptr<const INameRecognizer> name_recognizer)
    : PromptMasker(std::move(registry), std::move(name_recognizer), Config{}) {}

PromptMasker::PromptMasker(
    std::shared_ptr<const EntityPatternRegistry> registry,
    std::shared_ptr<const INameRecognizer> name_recognizer,
    Config config)
    : registry_(std::move(registry)),
      name_recognizer_(std::move(name_recognizer)),
      config_(config) {
    if (!registry_) {
        registry_ = std::make_shared<EntityPatternRegistry>();
    }
    if (!name_recognizer_) {
        name_recognizer_ = std::make_shared<NullNameRecognizer>();
    }
}

bool PromptMasker::name_recognition_enabled() const {
    return name_recognizer_->is_available();
}

std::string PromptMasker::make_placeholder(EntityCategory category, size_t index) {
    return std::format("[{}_{}]", category_to_string(category), index);
}

MaskingResult PromptMasker::mask(std::string_view text) const {
    Session session(text);
    apply_pattern_rules(session);
    apply_name_recognition(session);
    return std::move(session).finish(text);
}

void PromptMasker::apply_pattern_rules(Session& session) const {
    for (const auto& rule : registry_->rules()) {
        // Each pattern is its own pass over the text rewritten so far
        for (const auto& pattern : rule.patterns) {
            const auto matches = EntityPatternRegistry::find_matches(pattern, session.text());
            session.replace_spans(rule.category, matches, config_.log_detections);
        }
    }
}

void PromptMasker::apply_name_recognition(Session& session) const {
    if (!name_recognizer_->is_available()) {
        return;
    }

    std::vector<NameSpan> spans;
    try {
        spans = name_recognizer_->recognize(session.text());
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Name recognizer failed, skipping NAME pass: {}", e.what()));
        return;
    }

    const auto accepted = validate_name_spans(std::move(spans), session);
    session.replace_spans(EntityCategory::NAME, accepted, config_.log_detections);
}

std::vector<PatternMatch> PromptMasker::validate_name_spans(
    std::vector<NameSpan> spans, const Session& session) {

    std::stable_sort(spans.begin(), spans.end(),
        [](const NameSpan& a, const NameSpan& b) { return a.start < b.start; });

    const auto& text = session.text();
    std::vector<PatternMatch> accepted;
    accepted.reserve(spans.size());
    size_t rejected = 0;
    size_t last_end = 0;

    for (const auto& span : spans) {
        const bool in_range = span.start < span.end && span.end <= text.size();
        if (!in_range ||
            text.compare(span.start, span.end - span.start, span.text) != 0 ||
            (!accepted.empty() && span.start < last_end) ||
            session.overlaps_placeholder(span.start, span.end)) {
            ++rejected;
            continue;
        }
        accepted.push_back({span.start, span.end});
        last_end = span.end;
    }

    if (rejected > 0) {
        utils::log::warn(std::format("Name recognizer: dropped {} invalid span(s)", rejected));
    }
    return accepted;
}

// ============================================================================
// Unmasking
// ============================================================================

std::string PromptMasker::unmask(std::string_view text, const PlaceholderMapping& mappings) {
    if (mappings.empty() || text.empty()) {
        return std::string(text);
    }

    using Entry = PlaceholderMapping::value_type;
    std::vector<const Entry*> entries;
    entries.reserve(mappings.size());
    std::array<bool, 256> first_chars{};
    for (const auto& entry : mappings) {
        if (entry.first.empty()) continue;
        entries.push_back(&entry);
        first_chars[static_cast<unsigned char>(entry.first.front())] = true;
    }

    // Longest key first so a key that prefixes another never shadows it
    std::sort(entries.begin(), entries.end(), [](const Entry* a, const Entry* b) {
        if (a->first.size() != b->first.size()) return a->first.size() > b->first.size();
        return a->first < b->first;
    });

    std::string result;
    result.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (first_chars[static_cast<unsigned char>(text[i])]) {
            const auto rest = text.substr(i);
            const auto hit = std::find_if(entries.begin(), entries.end(),
                [&rest](const Entry* e) { return rest.starts_with(e->first); });
            if (hit != entries.end()) {
                result += (*hit)->second;
                i += (*hit)->first.size();
                continue;
            }
        }
        result += text[i++];
    }
    return result;
}

} // namespace promptguard
