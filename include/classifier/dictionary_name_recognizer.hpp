#pragma once

#include "classifier/entity_patterns.hpp"
#include "core/iname_recognizer.hpp"

#include <string>
#include <vector>

namespace promptguard {

/**
 * @brief Name recognizer backed by a fixed list of known names
 *
 * Matches configured names as whole words, case-sensitively, so the
 * common noun "mark" is not mistaken for "Mark". Unavailable when the
 * list is empty.
 */
class DictionaryNameRecognizer final : public INameRecognizer {
public:
    explicit DictionaryNameRecognizer(const std::vector<std::string>& names);

    [[nodiscard]] bool is_available() const override;

    [[nodiscard]] std::vector<NameSpan> recognize(const std::string& text) const override;

    [[nodiscard]] size_t name_count() const { return name_count_; }

private:
    CompiledPattern pattern_;
    size_t name_count_ = 0;
};

} // namespace promptguard
