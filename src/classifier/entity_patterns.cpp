#include "classifier/entity_patterns.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace promptguard {

namespace {

// ============================================================================
// Built-in vocabularies
// ============================================================================

const std::vector<std::string> kMentalHealthTerms = {
    "depression", "depressed", "anxiety", "anxious", "panic attack", "ptsd",
    "bipolar", "schizophrenia", "ocd", "adhd", "eating disorder", "anorexia",
    "bulimia", "addiction", "suicidal", "self-harm", "mental health",
    "mental illness", "psychiatric", "psychological condition",
};

const std::vector<std::string> kDiseaseTerms = {
    "diabetes", "cancer", "hiv", "aids", "covid", "covid-19", "coronavirus",
    "tuberculosis", "hepatitis", "heart disease", "hypertension", "asthma",
    "copd", "alzheimer", "alzheimer's", "parkinson", "parkinson's", "epilepsy",
    "arthritis", "multiple sclerosis", "lupus", "crohn", "crohn's", "celiac",
};

// Cities, states and countries share one LOCATION alternation. Entries that
// appear in more than one list ("New York", "Washington") collapse to one.
const std::vector<std::string> kLocationTerms = {
    // Major US cities
    "New York", "Los Angeles", "Chicago", "Houston", "Phoenix", "Philadelphia",
    "San Antonio", "San Diego", "Dallas", "San Jose", "Austin", "Jacksonville",
    "Fort Worth", "Columbus", "Indianapolis", "Charlotte", "San Francisco",
    "Seattle", "Denver", "Washington", "Boston", "Nashville", "Baltimore",
    "Oklahoma City", "Louisville", "Portland", "Las Vegas", "Milwaukee",
    "Albuquerque", "Tucson", "Fresno", "Sacramento", "Kansas City", "Mesa",
    "Atlanta", "Omaha", "Colorado Springs", "Raleigh", "Miami", "Long Beach",
    "Virginia Beach", "Oakland", "Minneapolis", "Tulsa", "Tampa", "Arlington",
    "New Orleans", "Wichita", "Cleveland", "Bakersfield", "Aurora", "Anaheim",
    "Honolulu", "Santa Ana", "Riverside", "Corpus Christi", "Lexington",
    "Stockton", "Henderson", "Saint Paul", "St. Paul", "Cincinnati",
    "St. Louis", "Pittsburgh", "Greensboro", "Lincoln", "Anchorage", "Plano",
    "Orlando", "Irvine", "Newark", "Durham", "Chula Vista", "Toledo",
    "Fort Wayne", "St. Petersburg", "Laredo", "Jersey City", "Chandler",
    "Madison", "Lubbock", "Scottsdale", "Reno", "Buffalo", "Gilbert",
    "Glendale", "North Las Vegas", "Winston-Salem", "Chesapeake", "Norfolk",
    "Fremont", "Garland", "Irving", "Hialeah", "Richmond", "Boise", "Spokane",
    "Baton Rouge",
    // US states
    "Alabama", "Alaska", "Arizona", "Arkansas", "California", "Colorado",
    "Connecticut", "Delaware", "Florida", "Georgia", "Hawaii", "Idaho",
    "Illinois", "Indiana", "Iowa", "Kansas", "Kentucky", "Louisiana", "Maine",
    "Maryland", "Massachusetts", "Michigan", "Minnesota", "Mississippi",
    "Missouri", "Montana", "Nebraska", "Nevada", "New Hampshire", "New Jersey",
    "New Mexico", "New York", "North Carolina", "North Dakota", "Ohio",
    "Oklahoma", "Oregon", "Pennsylvania", "Rhode Island", "South Carolina",
    "South Dakota", "Tennessee", "Texas", "Utah", "Vermont", "Virginia",
    "Washington", "West Virginia", "Wisconsin", "Wyoming",
    // Countries and regions
    "USA", "United States", "America", "UK", "United Kingdom", "England",
    "Canada", "Australia", "Germany", "France", "Italy", "Spain", "India",
    "China", "Japan", "Mexico", "Brazil",
};

const std::vector<std::string> kGenderTerms = {
    "male", "female", "man", "woman", "boy", "girl", "transgender",
    "non-binary", "gender",
};

const std::vector<std::string> kNoTerms;

// Structural patterns. Hyphens lead bracket expressions so they are literal.
// Every repeat is bounded (email runs to RFC 5321 lengths): libstdc++
// recurses once per character of an unbounded repeat and overflows the
// stack on long tokens.
constexpr const char* kEmailPattern =
    R"(\b[-A-Za-z0-9._%+]{1,64}@[-A-Za-z0-9.]{1,253}\.[A-Za-z]{2,63}\b)";

constexpr const char* kPhoneTenDigitPattern =
    R"(\b\d{3}[-.]?\d{3}[-.]?\d{4}\b)";
constexpr const char* kPhoneParenthesizedPattern =
    R"(\(\d{3}\)\s{0,8}\d{3}[-.]?\d{4}\b)";
constexpr const char* kPhoneInternationalPattern =
    R"(\+\d{1,3}[-.\s]?\d{1,4}[-.\s]?\d{1,4}[-.\s]?\d{1,9}\b)";

constexpr const char* kAgePattern =
    R"(\b(?:age|aged|year old|years old|yr old|yrs old)[\s:]{1,8}\d{1,3}\b)"
    R"(|\b\d{1,3}[-\s]?(?:years?|yrs?)[-\s]?old\b)";

const char* vocabulary_rule_name(EntityCategory category) {
    switch (category) {
        case EntityCategory::MENTAL_HEALTH: return "mental_health_terms";
        case EntityCategory::DISEASE: return "disease_terms";
        case EntityCategory::LOCATION: return "location_gazetteer";
        case EntityCategory::GENDER: return "gender_terms";
        default: return "vocabulary";
    }
}

constexpr auto kCaseInsensitive =
    std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
constexpr auto kCaseSensitive =
    std::regex::ECMAScript | std::regex::optimize;

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

EntityPatternRegistry::EntityPatternRegistry()
    : EntityPatternRegistry(Config{}) {}

EntityPatternRegistry::EntityPatternRegistry(const Config& config) {
    add_vocabulary_rule(EntityCategory::MENTAL_HEALTH, config);
    add_vocabulary_rule(EntityCategory::DISEASE, config);

    CategoryRule email{EntityCategory::EMAIL, {}};
    email.patterns.push_back(compile("email_address", kEmailPattern, kCaseSensitive));
    rules_.push_back(std::move(email));

    CategoryRule phone{EntityCategory::PHONE, {}};
    phone.patterns.push_back(compile("phone_ten_digit", kPhoneTenDigitPattern, kCaseSensitive));
    phone.patterns.push_back(compile("phone_parenthesized", kPhoneParenthesizedPattern, kCaseSensitive));
    phone.patterns.push_back(compile("phone_international", kPhoneInternationalPattern, kCaseSensitive));
    rules_.push_back(std::move(phone));

    CategoryRule age{EntityCategory::AGE, {}};
    age.patterns.push_back(compile("age_expression", kAgePattern, kCaseInsensitive));
    rules_.push_back(std::move(age));

    // LOCATION before GENDER: city/state names must not be claimed later
    add_vocabulary_rule(EntityCategory::LOCATION, config);
    add_vocabulary_rule(EntityCategory::GENDER, config);

    if (const size_t invalid = invalid_pattern_count(); invalid > 0) {
        utils::log::warn(std::format(
            "Entity pattern registry: {} pattern(s) failed to compile and will match nothing",
            invalid));
    }
}

void EntityPatternRegistry::add_vocabulary_rule(EntityCategory category, const Config& config) {
    std::vector<std::string> terms = default_vocabulary(category);
    if (const auto it = config.extra_terms.find(category); it != config.extra_terms.end()) {
        for (const auto& term : it->second) {
            const auto trimmed = utils::trim(term);
            if (!trimmed.empty()) terms.push_back(trimmed);
        }
    }

    CategoryRule rule{category, {}};
    const auto source = build_vocabulary_pattern(terms);
    if (!source.empty()) {
        rule.patterns.push_back(compile(vocabulary_rule_name(category), source, kCaseInsensitive));
    }
    rules_.push_back(std::move(rule));
}

CompiledPattern EntityPatternRegistry::compile(
    std::string name, std::string source, std::regex::flag_type flags) {

    CompiledPattern pattern;
    pattern.name = std::move(name);
    pattern.source = std::move(source);
    try {
        pattern.regex.emplace(pattern.source, flags);
    } catch (const std::regex_error& e) {
        utils::log::warn(std::format("Pattern '{}' failed to compile: {}",
            pattern.name, e.what()));
        pattern.regex.reset();
    }
    return pattern;
}

size_t EntityPatternRegistry::invalid_pattern_count() const {
    size_t invalid = 0;
    for (const auto& rule : rules_) {
        for (const auto& pattern : rule.patterns) {
            if (!pattern.is_valid()) ++invalid;
        }
    }
    return invalid;
}

// ============================================================================
// Matching
// ============================================================================

std::vector<PatternMatch> EntityPatternRegistry::find_matches(
    const CompiledPattern& pattern, const std::string& text) {

    std::vector<PatternMatch> matches;
    if (!pattern.is_valid() || text.empty()) {
        return matches;
    }

    try {
        const auto begin = std::sregex_iterator(text.begin(), text.end(), *pattern.regex);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            const auto& m = *it;
            if (m.length(0) == 0) continue;
            const auto start = static_cast<size_t>(m.position(0));
            matches.push_back({start, start + static_cast<size_t>(m.length(0))});
        }
    } catch (const std::regex_error& e) {
        // Complexity/stack limits on pathological input: degrade to no matches
        utils::log::warn(std::format("Pattern '{}' failed while matching: {}",
            pattern.name, e.what()));
        matches.clear();
    }
    return matches;
}

// ============================================================================
// Vocabulary helpers
// ============================================================================

std::string EntityPatternRegistry::escape_regex(std::string_view term) {
    static constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{})";
    std::string escaped;
    escaped.reserve(term.size() + term.size() / 4);
    for (const char c : term) {
        if (kSpecial.find(c) != std::string_view::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

std::string EntityPatternRegistry::build_vocabulary_pattern(
    const std::vector<std::string>& terms, bool case_sensitive) {

    std::vector<std::string> unique_terms;
    std::unordered_set<std::string> seen;
    unique_terms.reserve(terms.size());
    for (const auto& term : terms) {
        if (term.empty()) continue;
        if (seen.insert(case_sensitive ? term : utils::to_lower(term)).second) {
            unique_terms.push_back(term);
        }
    }
    if (unique_terms.empty()) {
        return "";
    }

    // Longest first: ECMAScript alternation takes the first branch that fits
    std::stable_sort(unique_terms.begin(), unique_terms.end(),
        [](const std::string& a, const std::string& b) {
            return a.size() > b.size();
        });

    std::string pattern = R"(\b(?:)";
    for (size_t i = 0; i < unique_terms.size(); ++i) {
        if (i > 0) pattern += '|';
        pattern += escape_regex(unique_terms[i]);
    }
    pattern += R"()\b)";
    return pattern;
}

bool EntityPatternRegistry::is_vocabulary_category(EntityCategory category) {
    switch (category) {
        case EntityCategory::MENTAL_HEALTH:
        case EntityCategory::DISEASE:
        case EntityCategory::LOCATION:
        case EntityCategory::GENDER:
            return true;
        default:
            return false;
    }
}

const std::vector<std::string>& EntityPatternRegistry::default_vocabulary(
    EntityCategory category) {

    switch (category) {
        case EntityCategory::MENTAL_HEALTH: return kMentalHealthTerms;
        case EntityCategory::DISEASE: return kDiseaseTerms;
        case EntityCategory::LOCATION: return kLocationTerms;
        case EntityCategory::GENDER: return kGenderTerms;
        default: return kNoTerms;
    }
}

} // namespace promptguard
