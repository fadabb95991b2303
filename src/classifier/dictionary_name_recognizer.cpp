#include "classifier/dictionary_name_recognizer.hpp"
#include "core/utils.hpp"

namespace promptguard {

DictionaryNameRecognizer::DictionaryNameRecognizer(const std::vector<std::string>& names) {
    std::vector<std::string> cleaned;
    cleaned.reserve(names.size());
    for (const auto& name : names) {
        auto trimmed = utils::trim(name);
        if (!trimmed.empty()) cleaned.push_back(std::move(trimmed));
    }
    name_count_ = cleaned.size();

    // Matched case-sensitively, so "Jordan" and "JORDAN" are distinct names
    const auto source = EntityPatternRegistry::build_vocabulary_pattern(cleaned, /*case_sensitive=*/true);
    if (!source.empty()) {
        pattern_ = EntityPatternRegistry::compile(
            "known_names", source, std::regex::ECMAScript | std::regex::optimize);
    }
}

bool DictionaryNameRecognizer::is_available() const {
    return pattern_.is_valid();
}

std::vector<NameSpan> DictionaryNameRecognizer::recognize(const std::string& text) const {
    std::vector<NameSpan> spans;
    for (const auto& m : EntityPatternRegistry::find_matches(pattern_, text)) {
        spans.emplace_back(m.start, m.end, text.substr(m.start, m.end - m.start));
    }
    return spans;
}

} // namespace promptguard
