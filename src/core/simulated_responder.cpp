#include "core/responder.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <vector>

namespace promptguard {

namespace {

const std::vector<std::string> kMentalHealthReplies = {
    "I understand you're dealing with [MENTAL_HEALTH_0]. It's important to seek professional help. "
    "Consider talking to a licensed therapist or counselor who can provide personalized support. "
    "Remember, taking care of your mental health is just as important as physical health.",

    "Dealing with [MENTAL_HEALTH_0] can be challenging. Here are some steps that might help: "
    "1) Reach out to a mental health professional, 2) Practice self-care activities, "
    "3) Connect with supportive friends or family, 4) Consider mindfulness or meditation practices. "
    "Would you like more specific information on any of these?",

    "Thank you for sharing about [MENTAL_HEALTH_0]. Many people experience similar challenges. "
    "Professional support can make a significant difference. If you're in crisis, please contact "
    "a crisis helpline immediately. Otherwise, scheduling an appointment with a therapist can be "
    "a great first step toward feeling better.",
};

const std::vector<std::string> kDiseaseReplies = {
    "For [DISEASE_0], it's crucial to work closely with healthcare professionals. "
    "They can provide proper diagnosis, treatment plans, and ongoing monitoring. "
    "Additionally, maintaining a healthy lifestyle through proper diet, exercise, and "
    "medication adherence (if prescribed) is important.",

    "Managing [DISEASE_0] requires comprehensive medical care. I recommend: "
    "1) Consulting with a specialist, 2) Following prescribed treatment plans, "
    "3) Regular check-ups and monitoring, 4) Staying informed about your condition. "
    "Your healthcare team can provide personalized guidance.",

    "Living with [DISEASE_0] can present challenges, but modern medicine offers many "
    "treatment options. Work with your healthcare provider to develop a management plan "
    "that works for you. Support groups and patient education resources can also be helpful.",
};

const std::vector<std::string> kContactReplies = {
    "I can help you with that. Based on your contact information ([EMAIL_0] or [PHONE_0]), "
    "here's what I suggest: Make sure to keep your contact details updated and verify "
    "the information before sharing with others.",

    "Thanks for providing your contact details. For privacy reasons, always be careful about "
    "where you share information like [EMAIL_0] and [PHONE_0]. Use secure channels when possible.",
};

const std::vector<std::string> kLocationReplies = {
    "In [LOCATION_0], there are various resources available. I can help you find specific "
    "services or information relevant to your area. What specific assistance are you looking for?",

    "For someone in [LOCATION_0], I recommend checking local resources and services. "
    "Many areas have community programs and support systems available.",
};

const std::vector<std::string> kAgeReplies = {
    "At [AGE_0], it's important to consider age-appropriate recommendations. "
    "Everyone's situation is unique, so personalized advice from professionals is valuable.",

    "For someone who is [AGE_0], there are specific considerations to keep in mind. "
    "I'm here to provide general information, but professional consultation is recommended "
    "for personalized guidance.",
};

const std::vector<std::string> kGeneralReplies = {
    "I understand your concern. Based on the information you've provided, I recommend "
    "consulting with appropriate professionals who can give you personalized advice. "
    "Is there anything specific you'd like to know more about?",

    "Thank you for your question. While I can provide general information, it's always best "
    "to seek professional advice for personal matters. What specific aspect would you like "
    "me to explain further?",

    "I'm here to help. Based on your query, it seems you're looking for guidance on a "
    "sensitive matter. Remember that professional experts in relevant fields can provide "
    "the most accurate and personalized assistance. How can I assist you further?",

    "That's an important question. Here's some general information that might help: "
    "Always prioritize your well-being and don't hesitate to reach out to qualified "
    "professionals when needed. What else would you like to know?",
};

const std::vector<std::string>& replies_for(ResponseTopic topic) {
    switch (topic) {
        case ResponseTopic::MENTAL_HEALTH: return kMentalHealthReplies;
        case ResponseTopic::DISEASE:       return kDiseaseReplies;
        case ResponseTopic::CONTACT:       return kContactReplies;
        case ResponseTopic::LOCATION:      return kLocationReplies;
        case ResponseTopic::AGE:           return kAgeReplies;
        default:                           return kGeneralReplies;
    }
}

template<size_t N>
bool contains_any(const std::string& haystack, const std::array<std::string_view, N>& needles) {
    return std::any_of(needles.begin(), needles.end(), [&haystack](std::string_view needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

} // anonymous namespace

SimulatedResponder::SimulatedResponder(uint64_t seed)
    : rng_(seed != 0 ? seed : std::random_device{}()) {}

ResponseTopic SimulatedResponder::classify_topic(std::string_view prompt) {
    static constexpr std::array<std::string_view, 4> kMentalHealthKeywords = {
        "mental_health", "anxiety", "depression", "stress"};
    static constexpr std::array<std::string_view, 4> kDiseaseKeywords = {
        "disease", "diabetes", "cancer", "health condition"};
    static constexpr std::array<std::string_view, 3> kContactKeywords = {
        "email", "phone", "contact"};
    static constexpr std::array<std::string_view, 4> kLocationKeywords = {
        "location", "city", "state", "country"};

    const auto lower = utils::to_lower(prompt);
    if (contains_any(lower, kMentalHealthKeywords)) return ResponseTopic::MENTAL_HEALTH;
    if (contains_any(lower, kDiseaseKeywords)) return ResponseTopic::DISEASE;
    if (contains_any(lower, kContactKeywords)) return ResponseTopic::CONTACT;
    if (contains_any(lower, kLocationKeywords)) return ResponseTopic::LOCATION;
    if (lower.find("age") != std::string::npos) return ResponseTopic::AGE;
    return ResponseTopic::GENERAL;
}

std::string SimulatedResponder::generate(const std::string& masked_prompt) {
    const auto& replies = replies_for(classify_topic(masked_prompt));
    std::uniform_int_distribution<size_t> pick(0, replies.size() - 1);

    std::lock_guard lock(rng_mutex_);
    return replies[pick(rng_)];
}

} // namespace promptguard
