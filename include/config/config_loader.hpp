#pragma once

#include "core/types.hpp"

#include <toml.hpp>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace promptguard {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Masking Config
// ============================================================================

struct MaskingConfig {
    bool name_recognition = false;
    std::vector<std::string> known_names;
    bool log_detections = false;

    // [masking.extra_terms] keyed by lower-case category name
    std::unordered_map<EntityCategory, std::vector<std::string>> extra_terms;
};

// ============================================================================
// Session Store Config
// ============================================================================

struct SessionConfig {
    int64_t max_sessions = 10000;
    int64_t ttl_seconds = 3600;     // 0 = never expire
};

// ============================================================================
// Responder Config
// ============================================================================

struct ResponderConfig {
    uint64_t seed = 0;              // 0 = non-deterministic
};

// ============================================================================
// PromptGuardConfig - Complete parsed configuration
// ============================================================================

struct PromptGuardConfig {
    LoggingConfig logging;
    MaskingConfig masking;
    SessionConfig sessions;
    ResponderConfig responder;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads promptguard.toml
 *
 * Every string value (including array elements) goes through ${VAR}
 * environment expansion; an unset variable expands to "" and an unclosed
 * "${" is a parse error. Missing sections keep their defaults.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        PromptGuardConfig config;

        static LoadResult ok(PromptGuardConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Returns one message per violated constraint (empty = valid)
    [[nodiscard]] static std::vector<std::string> validate_config(const PromptGuardConfig& config);

private:
    static PromptGuardConfig extract_all_sections(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static MaskingConfig extract_masking(const toml::table& root);
    static SessionConfig extract_sessions(const toml::table& root);
    static ResponderConfig extract_responder(const toml::table& root);

    static LoadResult validate_and_return(PromptGuardConfig config);
};

} // namespace promptguard
