#include <catch2/catch_test_macros.hpp>
#include "classifier/entity_patterns.hpp"
#include "core/masking.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace promptguard;

namespace {

// Substrings matched by every pattern of a category, in pass order
std::vector<std::string> matches_for(const EntityPatternRegistry& registry,
                                     EntityCategory category,
                                     const std::string& text) {
    std::vector<std::string> out;
    for (const auto& rule : registry.rules()) {
        if (rule.category != category) continue;
        for (const auto& pattern : rule.patterns) {
            for (const auto& m : EntityPatternRegistry::find_matches(pattern, text)) {
                out.push_back(text.substr(m.start, m.end - m.start));
            }
        }
    }
    return out;
}

} // anonymous namespace

TEST_CASE("Registry rule order", "[patterns]") {
    EntityPatternRegistry registry;
    const auto& rules = registry.rules();

    REQUIRE(rules.size() == 7);
    CHECK(rules[0].category == EntityCategory::MENTAL_HEALTH);
    CHECK(rules[1].category == EntityCategory::DISEASE);
    CHECK(rules[2].category == EntityCategory::EMAIL);
    CHECK(rules[3].category == EntityCategory::PHONE);
    CHECK(rules[4].category == EntityCategory::AGE);
    CHECK(rules[5].category == EntityCategory::LOCATION);
    CHECK(rules[6].category == EntityCategory::GENDER);

    CHECK(rules[3].patterns.size() == 3);
    CHECK(registry.invalid_pattern_count() == 0);
}

TEST_CASE("Email pattern", "[patterns]") {
    EntityPatternRegistry registry;

    SECTION("Plain address") {
        CHECK(matches_for(registry, EntityCategory::EMAIL, "Mail john.doe@example.com today") ==
              std::vector<std::string>{"john.doe@example.com"});
    }

    SECTION("Plus tag and multi-level domain") {
        CHECK(matches_for(registry, EntityCategory::EMAIL, "Contact jane_doe+tag@mail.example.co.uk now") ==
              std::vector<std::string>{"jane_doe+tag@mail.example.co.uk"});
    }

    SECTION("No top-level domain") {
        CHECK(matches_for(registry, EntityCategory::EMAIL, "user@localhost").empty());
    }
}

TEST_CASE("Phone patterns", "[patterns]") {
    EntityPatternRegistry registry;

    SECTION("Ten digits with separators") {
        CHECK(matches_for(registry, EntityCategory::PHONE, "555-123-4567") ==
              std::vector<std::string>{"555-123-4567"});
        CHECK(matches_for(registry, EntityCategory::PHONE, "555.123.4567") ==
              std::vector<std::string>{"555.123.4567"});
        CHECK(matches_for(registry, EntityCategory::PHONE, "call 5551234567 now") ==
              std::vector<std::string>{"5551234567"});
    }

    SECTION("Parenthesized area code") {
        CHECK(matches_for(registry, EntityCategory::PHONE, "Call (555) 123-4567") ==
              std::vector<std::string>{"(555) 123-4567"});
    }

    SECTION("International form") {
        CHECK(matches_for(registry, EntityCategory::PHONE, "Ring +44 20 7946 0958") ==
              std::vector<std::string>{"+44 20 7946 0958"});
    }

    SECTION("Short digit runs are not phones") {
        CHECK(matches_for(registry, EntityCategory::PHONE, "Room 42, floor 3, 2024").empty());
    }
}

TEST_CASE("Age pattern", "[patterns]") {
    EntityPatternRegistry registry;

    CHECK(matches_for(registry, EntityCategory::AGE, "I am aged 45") ==
          std::vector<std::string>{"aged 45"});
    CHECK(matches_for(registry, EntityCategory::AGE, "Age: 30, healthy") ==
          std::vector<std::string>{"Age: 30"});
    CHECK(matches_for(registry, EntityCategory::AGE, "a 30-year-old runner") ==
          std::vector<std::string>{"30-year-old"});
    CHECK(matches_for(registry, EntityCategory::AGE, "I'm 25 years old.") ==
          std::vector<std::string>{"25 years old"});
    CHECK(matches_for(registry, EntityCategory::AGE, "he is 42 yrs old") ==
          std::vector<std::string>{"42 yrs old"});
    CHECK(matches_for(registry, EntityCategory::AGE, "a page of 30 lines").empty());
}

TEST_CASE("Location gazetteer", "[patterns]") {
    EntityPatternRegistry registry;

    SECTION("Multi-word names win over their prefixes") {
        CHECK(matches_for(registry, EntityCategory::LOCATION, "I moved to Kansas City last year") ==
              std::vector<std::string>{"Kansas City"});
        CHECK(matches_for(registry, EntityCategory::LOCATION, "Raised in West Virginia") ==
              std::vector<std::string>{"West Virginia"});
        CHECK(matches_for(registry, EntityCategory::LOCATION, "North Las Vegas is hot") ==
              std::vector<std::string>{"North Las Vegas"});
    }

    SECTION("Punctuation inside names is literal") {
        CHECK(matches_for(registry, EntityCategory::LOCATION, "We flew to St. Paul") ==
              std::vector<std::string>{"St. Paul"});
        CHECK(matches_for(registry, EntityCategory::LOCATION, "We flew to StX Paul").empty());
    }

    SECTION("Case-insensitive") {
        CHECK(matches_for(registry, EntityCategory::LOCATION, "from texas") ==
              std::vector<std::string>{"texas"});
    }
}

TEST_CASE("Gender vocabulary is whole word", "[patterns]") {
    EntityPatternRegistry registry;
    CHECK(matches_for(registry, EntityCategory::GENDER, "a female engineer") ==
          std::vector<std::string>{"female"});
    CHECK(matches_for(registry, EntityCategory::GENDER, "the manager and the mailman").empty());
}

TEST_CASE("Invalid pattern is inert", "[patterns]") {
    const auto pattern = EntityPatternRegistry::compile("broken", "(unclosed");
    CHECK_FALSE(pattern.is_valid());
    CHECK(pattern.source == "(unclosed");
    CHECK(EntityPatternRegistry::find_matches(pattern, "(unclosed text").empty());
}

TEST_CASE("Regex escaping", "[patterns]") {
    CHECK(EntityPatternRegistry::escape_regex("St. Paul") == R"(St\. Paul)");
    CHECK(EntityPatternRegistry::escape_regex("a+b(c)") == R"(a\+b\(c\))");
    CHECK(EntityPatternRegistry::escape_regex("[x]|{y}") == R"(\[x\]\|\{y\})");
    CHECK(EntityPatternRegistry::escape_regex("non-binary") == "non-binary");
}

TEST_CASE("Vocabulary pattern construction", "[patterns]") {
    SECTION("Empty list") {
        CHECK(EntityPatternRegistry::build_vocabulary_pattern({}).empty());
        CHECK(EntityPatternRegistry::build_vocabulary_pattern({"", ""}).empty());
    }

    SECTION("Longest first") {
        CHECK(EntityPatternRegistry::build_vocabulary_pattern({"Kansas", "Kansas City"}) ==
              R"(\b(?:Kansas City|Kansas)\b)");
    }

    SECTION("Case-insensitive dedupe keeps first spelling") {
        CHECK(EntityPatternRegistry::build_vocabulary_pattern({"Ohio", "OHIO", "ohio"}) ==
              R"(\b(?:Ohio)\b)");
    }

    SECTION("Case-sensitive dedupe keeps distinct spellings") {
        CHECK(EntityPatternRegistry::build_vocabulary_pattern({"Ohio", "OHIO", "Ohio"}, true) ==
              R"(\b(?:Ohio|OHIO)\b)");
    }
}

TEST_CASE("Vocabulary categories", "[patterns]") {
    CHECK(EntityPatternRegistry::is_vocabulary_category(EntityCategory::MENTAL_HEALTH));
    CHECK(EntityPatternRegistry::is_vocabulary_category(EntityCategory::LOCATION));
    CHECK_FALSE(EntityPatternRegistry::is_vocabulary_category(EntityCategory::EMAIL));
    CHECK_FALSE(EntityPatternRegistry::is_vocabulary_category(EntityCategory::NAME));
    CHECK(EntityPatternRegistry::default_vocabulary(EntityCategory::PHONE).empty());
    CHECK_FALSE(EntityPatternRegistry::default_vocabulary(EntityCategory::DISEASE).empty());
}

TEST_CASE("Extra vocabulary terms", "[patterns]") {
    EntityPatternRegistry::Config config;
    config.extra_terms[EntityCategory::DISEASE] = {"migraine", "  gout  "};
    config.extra_terms[EntityCategory::LOCATION] = {"Reykjavik"};
    auto registry = std::make_shared<EntityPatternRegistry>(config);

    PromptMasker masker(registry);
    const auto result = masker.mask("Migraine and gout since moving to Reykjavik");

    CHECK(result.masked_text == "[DISEASE_0] and [DISEASE_1] since moving to [LOCATION_0]");
    CHECK(result.mappings.at("[DISEASE_0]") == "Migraine");
    CHECK(result.mappings.at("[DISEASE_1]") == "gout");

    // Built-ins still present
    CHECK(masker.mask("I have asthma").masked_text == "I have [DISEASE_0]");
}
