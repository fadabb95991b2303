#include <catch2/catch_test_macros.hpp>
#include "core/masking.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace promptguard;

namespace {

size_t count_prefix(const PlaceholderMapping& mappings, const std::string& prefix) {
    return static_cast<size_t>(std::count_if(mappings.begin(), mappings.end(),
        [&prefix](const auto& entry) { return entry.first.starts_with(prefix); }));
}

const std::vector<std::string> kSampleInputs = {
    "I'm dealing with depression and anxiety.",
    "My email is john.doe@example.com and my phone is 555-123-4567",
    "I'm a 30-year-old female with diabetes living in San Francisco.",
    "I have been diagnosed with cancer and also suffer from PTSD",
    "I live in New York and need mental health support. I'm 25 years old.",
    "Call (555) 987-6543 or +44 20 7946 0958 from Texas, aged 61.",
    "Nothing sensitive in this sentence at all.",
};

} // anonymous namespace

// ============================================================================
// Scenarios
// ============================================================================

TEST_CASE("Masking two mental health terms", "[masking]") {
    PromptMasker masker;
    const auto result = masker.mask("I'm dealing with depression and anxiety.");

    CHECK(result.original_text == "I'm dealing with depression and anxiety.");
    CHECK(result.masked_text == "I'm dealing with [MENTAL_HEALTH_0] and [MENTAL_HEALTH_1].");
    REQUIRE(result.mappings.size() == 2);
    CHECK(result.mappings.at("[MENTAL_HEALTH_0]") == "depression");
    CHECK(result.mappings.at("[MENTAL_HEALTH_1]") == "anxiety");
    REQUIRE(result.detected_entities.size() == 2);
    CHECK(result.detected_entities[0] == "MENTAL_HEALTH: depression");
    CHECK(result.detected_entities[1] == "MENTAL_HEALTH: anxiety");
}

TEST_CASE("Masking email and phone", "[masking]") {
    PromptMasker masker;
    const auto result = masker.mask(
        "My email is john.doe@example.com and my phone is 555-123-4567");

    CHECK(result.masked_text == "My email is [EMAIL_0] and my phone is [PHONE_0]");
    CHECK(result.mappings.at("[EMAIL_0]") == "john.doe@example.com");
    CHECK(result.mappings.at("[PHONE_0]") == "555-123-4567");
    CHECK(result.masked_text.find('@') == std::string::npos);

    std::string digits;
    for (char c : result.masked_text) {
        if (c >= '0' && c <= '9') digits += c;
    }
    CHECK(digits.find("5551234567") == std::string::npos);
}

TEST_CASE("Masking age, gender, disease and location", "[masking]") {
    PromptMasker masker;
    const auto result = masker.mask(
        "I'm a 30-year-old female with diabetes living in San Francisco.");

    CHECK(result.masked_text == "I'm a [AGE_0] [GENDER_0] with [DISEASE_0] living in [LOCATION_0].");
    REQUIRE(result.detected_entities.size() == 4);
    // Pass order: DISEASE, AGE, LOCATION, GENDER
    CHECK(result.detected_entities[0] == "DISEASE: diabetes");
    CHECK(result.detected_entities[1] == "AGE: 30-year-old");
    CHECK(result.detected_entities[2] == "LOCATION: San Francisco");
    CHECK(result.detected_entities[3] == "GENDER: female");

    const std::string reply =
        "As a [GENDER_0] aged [AGE_0] in [LOCATION_0], managing [DISEASE_0] takes care.";
    CHECK(PromptMasker::unmask(reply, result.mappings) ==
          "As a female aged 30-year-old in San Francisco, managing diabetes takes care.");
}

TEST_CASE("Unmasking a reply with four placeholders", "[masking]") {
    const PlaceholderMapping mappings = {
        {"[AGE_0]", "25 years old"},
        {"[MENTAL_HEALTH_0]", "anxiety"},
        {"[EMAIL_0]", "support@example.com"},
        {"[LOCATION_0]", "New York"},
    };
    CHECK(PromptMasker::unmask(
              "At [AGE_0], [MENTAL_HEALTH_0] is common. Contact [EMAIL_0] in [LOCATION_0].",
              mappings) ==
          "At 25 years old, anxiety is common. Contact support@example.com in New York.");
}

// ============================================================================
// Properties
// ============================================================================

TEST_CASE("Masking empty input", "[masking]") {
    PromptMasker masker;
    const auto result = masker.mask("");
    CHECK(result.masked_text.empty());
    CHECK(result.mappings.empty());
    CHECK(result.detected_entities.empty());
    CHECK_FALSE(result.has_detections());
}

TEST_CASE("Masking text without matches is the identity", "[masking]") {
    PromptMasker masker;
    const std::string text = "The weather is pleasant and the train left on time.";
    const auto result = masker.mask(text);
    CHECK(result.masked_text == text);
    CHECK(result.mappings.empty());
}

TEST_CASE("Mask then unmask restores the original", "[masking]") {
    PromptMasker masker;
    for (const auto& text : kSampleInputs) {
        INFO(text);
        const auto result = masker.mask(text);
        CHECK(PromptMasker::unmask(result.masked_text, result.mappings) == text);
    }
}

TEST_CASE("Unmask is idempotent once placeholders are resolved", "[masking]") {
    PromptMasker masker;
    for (const auto& text : kSampleInputs) {
        INFO(text);
        const auto result = masker.mask(text);
        const auto once = PromptMasker::unmask(result.masked_text, result.mappings);
        CHECK(PromptMasker::unmask(once, result.mappings) == once);
    }
}

TEST_CASE("Masked text leaks nothing the patterns would match", "[masking]") {
    PromptMasker masker;
    for (const auto& text : kSampleInputs) {
        INFO(text);
        const auto result = masker.mask(text);
        for (const auto& rule : masker.registry().rules()) {
            for (const auto& pattern : rule.patterns) {
                INFO(pattern.name);
                CHECK(EntityPatternRegistry::find_matches(pattern, result.masked_text).empty());
            }
        }
    }
}

TEST_CASE("Placeholder indices are contiguous per category", "[masking]") {
    PromptMasker masker;
    const auto result = masker.mask(
        "Depression, anxiety, PTSD and bipolar disorder, plus asthma and lupus.");

    CHECK(count_prefix(result.mappings, "[MENTAL_HEALTH_") == 4);
    CHECK(count_prefix(result.mappings, "[DISEASE_") == 2);
    for (size_t i = 0; i < 4; ++i) {
        CHECK(result.mappings.count(PromptMasker::make_placeholder(EntityCategory::MENTAL_HEALTH, i)) == 1);
    }
    CHECK(result.mappings.at("[MENTAL_HEALTH_0]") == "Depression");
    CHECK(result.mappings.at("[MENTAL_HEALTH_3]") == "bipolar");
    CHECK(result.mappings.at("[DISEASE_0]") == "asthma");
    CHECK(result.mappings.at("[DISEASE_1]") == "lupus");
}

TEST_CASE("Identical spans get distinct placeholders", "[masking]") {
    PromptMasker masker;
    const auto result = masker.mask("anxiety today, anxiety tomorrow");
    CHECK(result.masked_text == "[MENTAL_HEALTH_0] today, [MENTAL_HEALTH_1] tomorrow");
    REQUIRE(result.mappings.size() == 2);
    CHECK(result.mappings.at("[MENTAL_HEALTH_0]") == "anxiety");
    CHECK(result.mappings.at("[MENTAL_HEALTH_1]") == "anxiety");
}

TEST_CASE("Phone sub-patterns share one counter", "[masking]") {
    PromptMasker masker;
    const auto result = masker.mask(
        "Call 555-123-4567 or (555) 987-6543 or +44 20 7946 0958");

    CHECK(result.masked_text == "Call [PHONE_0] or [PHONE_1] or [PHONE_2]");
    CHECK(result.mappings.at("[PHONE_0]") == "555-123-4567");
    CHECK(result.mappings.at("[PHONE_1]") == "(555) 987-6543");
    CHECK(result.mappings.at("[PHONE_2]") == "+44 20 7946 0958");
}

TEST_CASE("Every mask call starts counters at zero", "[masking]") {
    PromptMasker masker;
    const auto first = masker.mask("I have asthma.");
    const auto second = masker.mask("I have lupus.");
    CHECK(first.masked_text == "I have [DISEASE_0].");
    CHECK(second.masked_text == "I have [DISEASE_0].");
    CHECK(second.mappings.at("[DISEASE_0]") == "lupus");
}

TEST_CASE("Vocabulary matching is case-insensitive and keeps original case", "[masking]") {
    PromptMasker masker;
    const auto result = masker.mask("DEPRESSION runs in my family in CALIFORNIA");
    CHECK(result.mappings.at("[MENTAL_HEALTH_0]") == "DEPRESSION");
    CHECK(result.mappings.at("[LOCATION_0]") == "CALIFORNIA");
}

TEST_CASE("Vocabulary matching is whole-word only", "[masking]") {
    PromptMasker masker;
    const auto result = masker.mask("The manager of the Manchester team is cancerous-free? No: mangoes.");
    CHECK(count_prefix(result.mappings, "[GENDER_") == 0);
    CHECK(count_prefix(result.mappings, "[DISEASE_") == 0);
}

TEST_CASE("Placeholders are never re-matched by later passes", "[masking]") {
    PromptMasker masker;
    // "gender" and "age" vocabulary must not fire on "[GENDER_0]" / "[AGE_0]"
    const auto result = masker.mask("My gender is female, age: 44");
    CHECK(result.masked_text == "My [GENDER_0] is [GENDER_1], [AGE_0]");
    CHECK(result.mappings.at("[AGE_0]") == "age: 44");
    CHECK(result.mappings.size() == 3);
}

TEST_CASE("Masking very long unbroken tokens", "[masking]") {
    PromptMasker masker;

    SECTION("Single 100k-character token") {
        const std::string token(100000, 'a');
        const auto result = masker.mask("Contact " + token + " about anxiety");
        CHECK(result.masked_text == "Contact " + token + " about [MENTAL_HEALTH_0]");
        REQUIRE(result.mappings.size() == 1);
        CHECK(result.mappings.at("[MENTAL_HEALTH_0]") == "anxiety");
    }

    SECTION("Oversized email-like token is not an address") {
        const std::string token = std::string(100000, 'a') + "@" + std::string(100000, 'b') + ".com";
        const auto result = masker.mask(token + " and depression");
        CHECK(count_prefix(result.mappings, "[EMAIL_") == 0);
        CHECK(result.mappings.at("[MENTAL_HEALTH_0]") == "depression");
    }

    SECTION("Long whitespace runs") {
        const std::string gap(100000, ' ');
        const auto result = masker.mask("age:" + gap + "30, (555)" + gap + "123-4567, asthma");
        CHECK(count_prefix(result.mappings, "[AGE_") == 0);
        CHECK(count_prefix(result.mappings, "[PHONE_") == 0);
        CHECK(result.mappings.at("[DISEASE_0]") == "asthma");
    }
}

TEST_CASE("Masker with explicit config", "[masking]") {
    PromptMasker::Config config;
    config.log_detections = true;
    PromptMasker masker(std::make_shared<EntityPatternRegistry>(), nullptr, config);

    const auto result = masker.mask("I have asthma");
    CHECK(result.masked_text == "I have [DISEASE_0]");
    CHECK_FALSE(masker.name_recognition_enabled());
}

TEST_CASE("Masker can be shared across threads", "[masking]") {
    const PromptMasker masker;
    const std::string text = "I'm a 30-year-old female with diabetes living in San Francisco.";
    const auto expected = masker.mask(text).masked_text;

    std::vector<std::thread> threads;
    std::vector<std::string> outputs(8);
    for (size_t t = 0; t < outputs.size(); ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 20; ++i) {
                outputs[t] = masker.mask(text).masked_text;
            }
        });
    }
    for (auto& th : threads) th.join();

    for (const auto& out : outputs) {
        CHECK(out == expected);
    }
}

// ============================================================================
// Unmask
// ============================================================================

TEST_CASE("Unmask replaces every occurrence", "[masking]") {
    const PlaceholderMapping mappings = {{"[LOCATION_0]", "Boston"}};
    CHECK(PromptMasker::unmask("[LOCATION_0] to [LOCATION_0] and back to [LOCATION_0]", mappings) ==
          "Boston to Boston and back to Boston");
}

TEST_CASE("Unmask leaves unknown tokens untouched", "[masking]") {
    const PlaceholderMapping mappings = {{"[EMAIL_0]", "a@b.io"}};
    CHECK(PromptMasker::unmask("[NAME_3] wrote to [EMAIL_0] and [EMAIL_1]", mappings) ==
          "[NAME_3] wrote to a@b.io and [EMAIL_1]");
}

TEST_CASE("Unmask with empty mapping is the identity", "[masking]") {
    CHECK(PromptMasker::unmask("At [AGE_0] all is well", {}) == "At [AGE_0] all is well");
    CHECK(PromptMasker::unmask("", {{"[AGE_0]", "30"}}).empty());
}

TEST_CASE("Unmask does not rescan restored values", "[masking]") {
    const PlaceholderMapping mappings = {
        {"[NAME_0]", "[EMAIL_0]"},
        {"[EMAIL_0]", "x@y.com"},
    };
    CHECK(PromptMasker::unmask("[NAME_0] / [EMAIL_0]", mappings) == "[EMAIL_0] / x@y.com");
}

TEST_CASE("Unmask prefers the longest key at a position", "[masking]") {
    const PlaceholderMapping mappings = {
        {"[PHONE_1]", "one"},
        {"[PHONE_10]", "ten"},
    };
    CHECK(PromptMasker::unmask("[PHONE_10] [PHONE_1]", mappings) == "ten one");
}

TEST_CASE("make_placeholder formats category and index", "[masking]") {
    CHECK(PromptMasker::make_placeholder(EntityCategory::MENTAL_HEALTH, 0) == "[MENTAL_HEALTH_0]");
    CHECK(PromptMasker::make_placeholder(EntityCategory::NAME, 12) == "[NAME_12]");
}
