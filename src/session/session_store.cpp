#include "session/session_store.hpp"

#include <algorithm>

namespace promptguard {

SessionMappingStore::SessionMappingStore()
    : SessionMappingStore(Config{}) {}

SessionMappingStore::SessionMappingStore(const Config& config)
    : config_(config) {
    config_.max_sessions = std::max(config_.max_sessions, size_t{1});
}

std::chrono::steady_clock::time_point SessionMappingStore::next_expiry() const {
    using Clock = std::chrono::steady_clock;
    if (config_.ttl.count() <= 0) {
        return Clock::time_point::max();
    }
    // Saturate instead of overflowing the clock's representation
    const auto now = Clock::now();
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::time_point::max() - now);
    if (config_.ttl >= headroom) {
        return Clock::time_point::max();
    }
    return now + config_.ttl;
}

bool SessionMappingStore::is_expired(
    const Entry& entry, std::chrono::steady_clock::time_point now) const {
    return now >= entry.expires_at;
}

void SessionMappingStore::merge(const std::string& session_id,
                                const PlaceholderMapping& mappings) {
    const auto expires = next_expiry();
    std::lock_guard lock(mutex_);

    auto it = map_.find(session_id);
    if (it != map_.end()) {
        auto& entry = *it->second;
        if (is_expired(entry, std::chrono::steady_clock::now())) {
            entry.mappings.clear();
            expirations_.fetch_add(1, std::memory_order_relaxed);
        }
        for (const auto& [placeholder, original] : mappings) {
            entry.mappings.insert_or_assign(placeholder, original);
        }
        entry.expires_at = expires;
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        return;
    }

    // Evict least recently used if at capacity
    while (map_.size() >= config_.max_sessions && !lru_list_.empty()) {
        map_.erase(lru_list_.back().session_id);
        lru_list_.pop_back();
        evictions_.fetch_add(1, std::memory_order_relaxed);
    }

    lru_list_.push_front(Entry{session_id, mappings, expires});
    map_[session_id] = lru_list_.begin();
}

std::optional<PlaceholderMapping> SessionMappingStore::get(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    auto it = map_.find(session_id);
    if (it == map_.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    if (is_expired(*it->second, std::chrono::steady_clock::now())) {
        lru_list_.erase(it->second);
        map_.erase(it);
        expirations_.fetch_add(1, std::memory_order_relaxed);
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    it->second->expires_at = next_expiry();
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
    hits_.fetch_add(1, std::memory_order_relaxed);
    return it->second->mappings;
}

bool SessionMappingStore::erase(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    auto it = map_.find(session_id);
    if (it == map_.end()) return false;
    lru_list_.erase(it->second);
    map_.erase(it);
    return true;
}

size_t SessionMappingStore::purge_expired() {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard lock(mutex_);
    size_t removed = 0;
    for (auto it = lru_list_.begin(); it != lru_list_.end();) {
        if (is_expired(*it, now)) {
            map_.erase(it->session_id);
            it = lru_list_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    expirations_.fetch_add(removed, std::memory_order_relaxed);
    return removed;
}

size_t SessionMappingStore::size() const {
    std::lock_guard lock(mutex_);
    return map_.size();
}

SessionMappingStore::Stats SessionMappingStore::get_stats() const {
    return {
        .hits = hits_.load(std::memory_order_relaxed),
        .misses = misses_.load(std::memory_order_relaxed),
        .evictions = evictions_.load(std::memory_order_relaxed),
        .expirations = expirations_.load(std::memory_order_relaxed),
        .current_sessions = size(),
    };
}

} // namespace promptguard
