#ifndef REPORT_COUNT_CACHE_HPP
#define REPORT_COUNT_CACHE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ctsafety {

struct CachedCount {
    long long count = 0;
    double age_seconds = 0.0;
};

/**
 * @brief Bounded time-to-live cache of external report counts, keyed by ReportQuery::key().
 *
 * Entries older than the TTL are never returned. When full, expired slots are reused
 * first; otherwise the least frequently used entry is evicted, ties going to the least
 * recently used. All operations are serialized by one mutex.
 */
class ReportCountCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    /**
     * @param capacity Maximum number of entries.
     * @param ttl      Lifetime of an entry.
     * @param clock    Time source; defaults to std::chrono::steady_clock::now.
     */
    ReportCountCache(std::size_t capacity, std::chrono::milliseconds ttl, Clock clock = {});

    ReportCountCache(const ReportCountCache&) = delete;
    ReportCountCache& operator=(const ReportCountCache&) = delete;

    std::optional<CachedCount> get(const std::string& key);
    void put(const std::string& key, long long count);
    void clear();

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    std::chrono::milliseconds ttl() const { return ttl_; }

    std::size_t hits() const { return hits_.load(std::memory_order_relaxed); }
    std::size_t misses() const { return misses_.load(std::memory_order_relaxed); }
    std::size_t expirations() const { return expirations_.load(std::memory_order_relaxed); }

private:
    std::chrono::steady_clock::time_point now() const;
    bool expiredLocked(std::size_t slot, std::chrono::steady_clock::time_point now) const;
    void releaseLocked(std::size_t slot);
    std::size_t evictLocked(std::chrono::steady_clock::time_point now);

    const std::size_t capacity_;
    const std::chrono::milliseconds ttl_;
    Clock clock_;

    std::uint32_t current_tick_ = 0;
    std::unordered_map<std::string, std::size_t> index_;
    std::vector<std::size_t> free_slots_;

    std::vector<std::string> keys_;
    std::vector<long long> values_;
    std::vector<std::chrono::steady_clock::time_point> stored_at_;
    std::vector<std::uint32_t> frequencies_;
    std::vector<std::uint32_t> timestamps_;

    mutable std::mutex mutex_;

    std::atomic<std::size_t> hits_{0};
    std::atomic<std::size_t> misses_{0};
    std::atomic<std::size_t> expirations_{0};
};

} // namespace ctsafety

#endif // REPORT_COUNT_CACHE_HPP
