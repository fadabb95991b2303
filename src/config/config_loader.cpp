#include "config/config_loader.hpp"
#include "classifier/entity_patterns.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace promptguard {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

// 100 years; larger values overflow steady_clock arithmetic
constexpr int64_t kMaxTtlSeconds = int64_t{100} * 365 * 24 * 3600;

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

MaskingConfig ConfigLoader::extract_masking(const toml::table& root) {
    MaskingConfig cfg;
    const auto* masking = root["masking"].as_table();
    if (!masking) return cfg;
    const auto& m = *masking;

    cfg.name_recognition = m["name_recognition"].value_or(false);
    cfg.known_names = toml_string_array(m, "known_names");
    cfg.log_detections = m["log_detections"].value_or(false);

    if (const auto* extra = m["extra_terms"].as_table()) {
        for (auto&& [key, val] : *extra) {
            const auto name = std::string(key.str());
            const auto category = category_from_string(utils::to_upper(name));
            if (!category || !EntityPatternRegistry::is_vocabulary_category(*category)) {
                throw std::runtime_error(std::format(
                    "masking.extra_terms.{} is not a vocabulary category "
                    "(expected mental_health, disease, location or gender)", name));
            }
            if (!val.is_array()) {
                throw std::runtime_error(std::format(
                    "masking.extra_terms.{} must be an array of strings", name));
            }
            cfg.extra_terms[*category] = toml_string_array(*extra, name);
        }
    }
    return cfg;
}

SessionConfig ConfigLoader::extract_sessions(const toml::table& root) {
    SessionConfig cfg;
    const auto* sessions = root["sessions"].as_table();
    if (!sessions) return cfg;
    const auto& s = *sessions;

    cfg.max_sessions = s["max_sessions"].value_or(int64_t{10000});
    cfg.ttl_seconds = s["ttl_seconds"].value_or(int64_t{3600});
    return cfg;
}

ResponderConfig ConfigLoader::extract_responder(const toml::table& root) {
    ResponderConfig cfg;
    const auto* responder = root["responder"].as_table();
    if (!responder) return cfg;

    const auto seed = (*responder)["seed"].value_or(int64_t{0});
    if (seed < 0) {
        throw std::runtime_error(std::format("responder.seed must be >= 0, got {}", seed));
    }
    cfg.seed = static_cast<uint64_t>(seed);
    return cfg;
}

PromptGuardConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    PromptGuardConfig config;
    config.logging = extract_logging(tbl);
    config.masking = extract_masking(tbl);
    config.sessions = extract_sessions(tbl);
    config.responder = extract_responder(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(PromptGuardConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const PromptGuardConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be info, warn or error, got '{}'", config.logging.level));
    }

    if (config.sessions.max_sessions <= 0) {
        errors.push_back(std::format(
            "sessions.max_sessions must be > 0, got {}", config.sessions.max_sessions));
    }
    if (config.sessions.ttl_seconds < 0 || config.sessions.ttl_seconds > kMaxTtlSeconds) {
        errors.push_back(std::format(
            "sessions.ttl_seconds must be in [0, {}], got {}",
            kMaxTtlSeconds, config.sessions.ttl_seconds));
    }

    return errors;
}

} // namespace promptguard
