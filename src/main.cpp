#include "config/config_loader.hpp"
#include "core/json.hpp"
#include "core/masking.hpp"
#include "core/utils.hpp"
#include "server/chat_service.hpp"
#include "server/service_factory.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace promptguard;

namespace {

constexpr const char* kDefaultConfigPath = "config/promptguard.toml";

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_usage() {
    std::cerr <<
        "Usage: promptguard [--config FILE] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  mask <text>                   Mask sensitive spans, print JSON result\n"
        "  unmask <text> <mapping.json>  Restore placeholders from a mapping file\n"
        "  chat [--session ID]           Masked chat loop over stdin lines\n"
        "  demo                          Run the built-in masking showcase\n";
}

/// Prints the response body; returns the process exit code
int emit(const Result<nlohmann::json>& result) {
    if (result.is_ok()) {
        std::cout << dump_lenient(result.value(), 2) << "\n";
        return kExitOk;
    }
    utils::log::warn(std::format("Request failed ({}): {}",
        error_category_to_string(result.error_category()), result.error_message()));
    std::cout << dump_lenient(ChatService::error_body(result.error_message()), 2) << "\n";
    return kExitFailure;
}

PromptGuardConfig load_config(const std::string& path, bool explicit_path, bool& ok) {
    ok = true;
    if (!explicit_path && !std::filesystem::exists(path)) {
        utils::log::info(std::format("No config at {}, using defaults", path));
        return PromptGuardConfig{};
    }

    utils::log::info(std::format("Loading configuration from {}", path));
    auto result = ConfigLoader::load_from_file(path);
    if (!result.success) {
        utils::log::error(result.error_message);
        ok = false;
        return PromptGuardConfig{};
    }
    return std::move(result.config);
}

int run_unmask(ChatService& service, const std::string& text, const std::string& mapping_path) {
    std::ifstream file(mapping_path);
    if (!file) {
        utils::log::error(std::format("Cannot open mapping file {}", mapping_path));
        return kExitFailure;
    }

    nlohmann::json mappings = nlohmann::json::parse(file, nullptr, /*allow_exceptions=*/false);
    if (mappings.is_discarded()) {
        utils::log::error(std::format("Mapping file {} is not valid JSON", mapping_path));
        return kExitFailure;
    }
    // Accept either a bare mapping object or a full mask response
    if (mappings.contains("mappings")) {
        mappings = mappings["mappings"];
    }

    return emit(service.handle_unmask({{"masked_text", text}, {"mappings", mappings}}));
}

int run_chat(ChatService& service, const std::string& session_id) {
    std::string line;
    while (std::getline(std::cin, line)) {
        line = utils::trim(line);
        if (line.empty()) continue;
        const auto result = service.handle_chat({{"message", line}, {"session_id", session_id}});
        if (result.is_ok()) {
            std::cout << dump_lenient(result.value()) << "\n";
        } else {
            std::cout << dump_lenient(ChatService::error_body(result.error_message())) << "\n";
        }
        std::cout.flush();
    }

    const auto stats = service.sessions().get_stats();
    utils::log::info(std::format("Chat finished: {} session(s), {} hit(s), {} eviction(s)",
        stats.current_sessions, stats.hits, stats.evictions));
    return kExitOk;
}

int run_demo(const ChatService& service) {
    const std::vector<std::pair<std::string, std::string>> examples = {
        {"Mental Health Condition",
         "I'm dealing with depression and anxiety. Can you help me?"},
        {"Contact Information",
         "My email is john.doe@example.com and my phone is 555-123-4567"},
        {"Complex Personal Information",
         "I'm a 30-year-old female with diabetes living in San Francisco. Email: patient@example.com"},
        {"Multiple Medical Conditions",
         "I have been diagnosed with cancer and also suffer from PTSD"},
        {"Location-based Information",
         "I live in New York and need mental health support. I'm 25 years old."},
    };

    const std::string separator(80, '=');
    size_t n = 1;
    for (const auto& [title, text] : examples) {
        const auto result = service.handle_mask({{"text", text}});
        if (result.is_error()) {
            return emit(result);
        }
        const auto& body = result.value();
        std::cout << std::format("Example {}: {}\n{}\n", n++, title, std::string(80, '-'));
        std::cout << std::format("Original:  {}\n", body["original_text"].get<std::string>());
        std::cout << std::format("Masked:    {}\n", body["masked_text"].get<std::string>());
        std::cout << std::format("Protected: {} sensitive items\n", body["detected_entities"].size());
        for (const auto& entity : body["detected_entities"]) {
            std::cout << "  - " << entity.get<std::string>() << "\n";
        }
        std::cout << "\n" << separator << "\n\n";
    }

    const std::string masked_response =
        "At [AGE_0], dealing with [MENTAL_HEALTH_0] is common. "
        "Contact [EMAIL_0] for support in [LOCATION_0].";
    const PlaceholderMapping mappings = {
        {"[AGE_0]", "25 years old"},
        {"[MENTAL_HEALTH_0]", "anxiety"},
        {"[EMAIL_0]", "support@example.com"},
        {"[LOCATION_0]", "New York"},
    };
    std::cout << std::format("Example {}: Unmasking Demonstration\n{}\n", n, std::string(80, '-'));
    std::cout << std::format("Masked Response:   {}\n", masked_response);
    std::cout << std::format("Unmasked Response: {}\n", PromptMasker::unmask(masked_response, mappings));
    std::cout << "\n" << separator << "\n";
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_path = kDefaultConfigPath;
        bool explicit_config = false;
        std::vector<std::string> args;

        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--config") {
                if (i + 1 >= argc) {
                    print_usage();
                    return kExitUsage;
                }
                config_path = argv[++i];
                explicit_config = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage();
                return kExitOk;
            } else {
                args.push_back(arg);
            }
        }

        if (args.empty()) {
            print_usage();
            return kExitUsage;
        }

        bool config_ok = true;
        const auto config = load_config(config_path, explicit_config, config_ok);
        if (!config_ok) {
            return kExitFailure;
        }
        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        auto service = make_chat_service(config);
        const auto& command = args[0];

        if (command == "mask" && args.size() == 2) {
            return emit(service->handle_mask({{"text", args[1]}}));
        }
        if (command == "unmask" && args.size() == 3) {
            return run_unmask(*service, args[1], args[2]);
        }
        if (command == "chat") {
            std::string session_id = ChatService::kDefaultSessionId;
            if (args.size() == 3 && args[1] == "--session") {
                session_id = args[2];
            } else if (args.size() != 1) {
                print_usage();
                return kExitUsage;
            }
            return run_chat(*service, session_id);
        }
        if (command == "demo" && args.size() == 1) {
            return run_demo(*service);
        }

        print_usage();
        return kExitUsage;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return kExitFailure;
    }
}
