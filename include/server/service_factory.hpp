#pragma once

#include "config/config_loader.hpp"
#include "core/masking.hpp"
#include "core/responder.hpp"
#include "server/chat_service.hpp"

#include <memory>

namespace promptguard {

/**
 * @brief Build a masker from [masking] settings
 *
 * name_recognition with an empty known_names list logs a warning and
 * leaves the NAME pass disabled.
 */
[[nodiscard]] std::shared_ptr<const PromptMasker> make_masker(const MaskingConfig& config);

/**
 * @brief Wire masker, session store and responder from a full config
 * @param responder nullptr = SimulatedResponder seeded from [responder]
 */
[[nodiscard]] std::shared_ptr<ChatService> make_chat_service(
    const PromptGuardConfig& config,
    std::shared_ptr<IResponder> responder = nullptr);

} // namespace promptguard
