#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <string_view>

namespace promptguard {

/**
 * @brief Response generator that consumes masked prompts.
 *
 * Receives only masked text; any placeholder it echoes back is resolved by
 * PromptMasker::unmask with the mapping of the same turn.
 */
class IResponder {
public:
    virtual ~IResponder() = default;

    [[nodiscard]] virtual std::string generate(const std::string& masked_prompt) = 0;
};

enum class ResponseTopic : uint8_t {
    MENTAL_HEALTH,
    DISEASE,
    CONTACT,
    LOCATION,
    AGE,
    GENERAL
};

/**
 * @brief Offline responder returning canned, topic-matched replies.
 *
 * Topic is picked from keywords in the lower-cased prompt (placeholders
 * such as "[mental_health_0]" count as keywords). Replies reference the
 * first placeholder of the topic's category, e.g. "[DISEASE_0]".
 * Variant choice uses a seeded std::mt19937; seed 0 draws from
 * std::random_device.
 */
class SimulatedResponder final : public IResponder {
public:
    explicit SimulatedResponder(uint64_t seed = 0);

    [[nodiscard]] std::string generate(const std::string& masked_prompt) override;

    [[nodiscard]] static ResponseTopic classify_topic(std::string_view prompt);

private:
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

} // namespace promptguard
