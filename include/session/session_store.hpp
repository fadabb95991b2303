#pragma once

#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace promptguard {

/**
 * @brief Caller-owned store of accumulated placeholder mappings per session
 *
 * Multi-turn conversations merge each turn's mapping into the session's
 * entry; identical placeholder keys from a later turn overwrite earlier ones.
 * Bounded by max_sessions (least-recently-used eviction) and an idle TTL
 * (refreshed on merge and get). Thread-safe.
 */
class SessionMappingStore {
public:
    struct Config {
        size_t max_sessions = 10000;
        std::chrono::milliseconds ttl{std::chrono::hours(1)};   // 0 = never expire
    };

    SessionMappingStore();
    explicit SessionMappingStore(const Config& config);

    void merge(const std::string& session_id, const PlaceholderMapping& mappings);

    /// Copy of the accumulated mapping; nullopt when unknown or expired
    [[nodiscard]] std::optional<PlaceholderMapping> get(const std::string& session_id);

    bool erase(const std::string& session_id);

    /// Remove all idle-expired sessions, returns how many were removed
    size_t purge_expired();

    [[nodiscard]] size_t size() const;

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t evictions;
        uint64_t expirations;
        size_t current_sessions;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct Entry {
        std::string session_id;
        PlaceholderMapping mappings;
        std::chrono::steady_clock::time_point expires_at;
    };

    [[nodiscard]] std::chrono::steady_clock::time_point next_expiry() const;
    [[nodiscard]] bool is_expired(const Entry& entry,
                                  std::chrono::steady_clock::time_point now) const;

    Config config_;
    mutable std::mutex mutex_;
    std::list<Entry> lru_list_;     // front = most recently used
    std::unordered_map<std::string, std::list<Entry>::iterator> map_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> expirations_{0};
};

} // namespace promptguard
