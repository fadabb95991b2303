#include "server/chat_service.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace promptguard {

namespace {

using json = nlohmann::json;

// Field present and a string
bool has_string(const json& request, const char* field) {
    return request.is_object() && request.contains(field) && request[field].is_string();
}

Result<json> invalid(std::string message) {
    return Result<json>::error(ErrorCategory::INVALID_REQUEST, std::move(message));
}

Result<json> internal(const char* endpoint, const std::exception& e) {
    utils::log::error(std::format("Error in {} handler: {}", endpoint, e.what()));
    return Result<json>::error(ErrorCategory::INTERNAL_ERROR,
        std::format("Internal server error: {}", e.what()));
}

} // anonymous namespace

ChatService::ChatService(std::shared_ptr<const PromptMasker> masker,
                         std::shared_ptr<IResponder> responder,
                         std::shared_ptr<SessionMappingStore> sessions)
    : masker_(std::move(masker)),
      responder_(std::move(responder)),
      sessions_(std::move(sessions)) {
    if (!masker_ || !responder_ || !sessions_) {
        throw std::invalid_argument("ChatService requires masker, responder and session store");
    }
}

Result<json> ChatService::handle_chat(const json& request) {
    if (!has_string(request, "message")) {
        return invalid("Missing required field: message");
    }
    std::string session_id = kDefaultSessionId;
    if (request.contains("session_id")) {
        if (!request["session_id"].is_string()) {
            return invalid("Field session_id must be a string");
        }
        session_id = request["session_id"].get<std::string>();
    }

    try {
        const utils::Timer timer;
        const auto& message = request["message"].get_ref<const std::string&>();

        // Step 1: mask, and keep this turn's mapping for the session
        const auto masked = masker_->mask(message);
        sessions_->merge(session_id, masked.mappings);

        // Step 2: the responder only ever sees masked text
        const auto reply = responder_->generate(masked.masked_text);

        // Step 3: restore originals into the reply
        const auto final_reply = PromptMasker::unmask(reply, masked.mappings);

        utils::log::info(std::format("chat session={} detections={} elapsed={}us",
            session_id, masked.detected_entities.size(), timer.elapsed_us().count()));

        return Result<json>::ok(json{
            {"success", true},
            {"original_prompt", masked.original_text},
            {"masked_prompt", masked.masked_text},
            {"llm_response", reply},
            {"final_response", final_reply},
            {"detected_entities", masked.detected_entities},
            {"session_id", session_id},
        });
    } catch (const std::exception& e) {
        return internal("chat", e);
    }
}

Result<json> ChatService::handle_mask(const json& request) const {
    if (!has_string(request, "text")) {
        return invalid("Missing required field: text");
    }

    try {
        json body = masker_->mask(request["text"].get_ref<const std::string&>());
        body["success"] = true;
        return Result<json>::ok(std::move(body));
    } catch (const std::exception& e) {
        return internal("mask", e);
    }
}

Result<json> ChatService::handle_unmask(const json& request) const {
    if (!has_string(request, "masked_text") || !request.contains("mappings")) {
        return invalid("Missing required fields: masked_text and mappings");
    }
    const auto mappings = mapping_from_json(request["mappings"]);
    if (!mappings) {
        return invalid("Field mappings must be an object of string values");
    }

    try {
        const auto& masked_text = request["masked_text"].get_ref<const std::string&>();
        return Result<json>::ok(json{
            {"success", true},
            {"masked_text", masked_text},
            {"unmasked_text", PromptMasker::unmask(masked_text, *mappings)},
        });
    } catch (const std::exception& e) {
        return internal("unmask", e);
    }
}

json ChatService::handle_health() {
    return json{
        {"status", "healthy"},
        {"service", kServiceName},
    };
}

Result<json> ChatService::handle(std::string_view route, const std::string& body) {
    if (route == "health") {
        return Result<json>::ok(handle_health());
    }

    json request = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (request.is_discarded()) {
        return invalid("Request body is not valid JSON");
    }

    if (route == "chat") return handle_chat(request);
    if (route == "mask") return handle_mask(request);
    if (route == "unmask") return handle_unmask(request);
    return invalid(std::format("Unknown route: {}", route));
}

json ChatService::error_body(const std::string& message) {
    return json{
        {"success", false},
        {"error", message},
    };
}

} // namespace promptguard
