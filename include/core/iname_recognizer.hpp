#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace promptguard {

/**
 * @brief Person-name recognition capability consumed by the masker.
 *
 * Invoked at most once per mask call, after all pattern passes, on the
 * already-rewritten text. Offsets in the returned spans refer to that text.
 * Implementations must be safe to call concurrently.
 */
class INameRecognizer {
public:
    virtual ~INameRecognizer() = default;

    /// false => the masker skips the NAME step silently
    [[nodiscard]] virtual bool is_available() const = 0;

    [[nodiscard]] virtual std::vector<NameSpan> recognize(const std::string& text) const = 0;
};

/**
 * @brief Default recognizer: reports itself unavailable, finds nothing
 */
class NullNameRecognizer final : public INameRecognizer {
public:
    [[nodiscard]] bool is_available() const override { return false; }

    [[nodiscard]] std::vector<NameSpan> recognize(const std::string&) const override {
        return {};
    }
};

} // namespace promptguard
