#pragma once

#include "core/error.hpp"
#include "core/masking.hpp"
#include "core/responder.hpp"
#include "session/session_store.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace promptguard {

/**
 * @brief Transport-agnostic request handlers around the masking core
 *
 * Requests and responses are JSON objects; an embedding HTTP layer only
 * has to route bodies here and serialize the result. Errors come back as
 * Result::error with INVALID_REQUEST (bad payload) or INTERNAL_ERROR
 * (caught exception, already logged); error_body() renders either.
 *
 * Request shapes:
 *   chat:   {"message": str, "session_id"?: str}
 *   mask:   {"text": str}
 *   unmask: {"masked_text": str, "mappings": {str: str}}
 */
class ChatService {
public:
    static constexpr const char* kDefaultSessionId = "default";
    static constexpr const char* kServiceName = "Privacy-Preserving AI Chatbot";

    ChatService(std::shared_ptr<const PromptMasker> masker,
                std::shared_ptr<IResponder> responder,
                std::shared_ptr<SessionMappingStore> sessions);

    /**
     * @brief Mask -> store mapping -> respond -> unmask
     *
     * The reply is unmasked with this turn's mapping; the session store
     * keeps the union across turns for the caller.
     */
    [[nodiscard]] Result<nlohmann::json> handle_chat(const nlohmann::json& request);

    [[nodiscard]] Result<nlohmann::json> handle_mask(const nlohmann::json& request) const;

    [[nodiscard]] Result<nlohmann::json> handle_unmask(const nlohmann::json& request) const;

    [[nodiscard]] static nlohmann::json handle_health();

    /**
     * @brief Parse a raw body and dispatch by route ("chat", "mask", "unmask", "health")
     */
    [[nodiscard]] Result<nlohmann::json> handle(std::string_view route, const std::string& body);

    [[nodiscard]] static nlohmann::json error_body(const std::string& message);

    [[nodiscard]] const SessionMappingStore& sessions() const { return *sessions_; }

private:
    std::shared_ptr<const PromptMasker> masker_;
    std::shared_ptr<IResponder> responder_;
    std::shared_ptr<SessionMappingStore> sessions_;
};

} // namespace promptguard
