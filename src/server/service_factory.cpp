#include "server/service_factory.hpp"
#include "classifier/dictionary_name_recognizer.hpp"
#include "core/utils.hpp"

#include <format>

namespace promptguard {

std::shared_ptr<const PromptMasker> make_masker(const MaskingConfig& config) {
    EntityPatternRegistry::Config registry_config;
    registry_config.extra_terms = config.extra_terms;
    auto registry = std::make_shared<EntityPatternRegistry>(registry_config);

    std::shared_ptr<const INameRecognizer> recognizer;
    if (config.name_recognition) {
        auto dictionary = std::make_shared<DictionaryNameRecognizer>(config.known_names);
        if (dictionary->is_available()) {
            utils::log::info(std::format("Name recognition enabled ({} known names)",
                dictionary->name_count()));
            recognizer = std::move(dictionary);
        } else {
            utils::log::warn("Name recognition requested but no usable known_names; NAME pass disabled");
        }
    }

    PromptMasker::Config masker_config;
    masker_config.log_detections = config.log_detections;
    return std::make_shared<PromptMasker>(std::move(registry), std::move(recognizer), masker_config);
}

std::shared_ptr<ChatService> make_chat_service(
    const PromptGuardConfig& config, std::shared_ptr<IResponder> responder) {

    SessionMappingStore::Config store_config;
    store_config.max_sessions = static_cast<size_t>(config.sessions.max_sessions);
    store_config.ttl = std::chrono::seconds(config.sessions.ttl_seconds);
    auto sessions = std::make_shared<SessionMappingStore>(store_config);

    if (!responder) {
        responder = std::make_shared<SimulatedResponder>(config.responder.seed);
    }

    return std::make_shared<ChatService>(
        make_masker(config.masking), std::move(responder), std::move(sessions));
}

} // namespace promptguard
