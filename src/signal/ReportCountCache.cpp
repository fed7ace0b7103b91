#include "signal/ReportCountCache.hpp"
#include "exceptions/Exceptions.hpp"

#include <limits>

namespace ctsafety {

ReportCountCache::ReportCountCache(std::size_t capacity, std::chrono::milliseconds ttl, Clock clock)
    : capacity_(capacity), ttl_(ttl), clock_(std::move(clock))
{
    if (capacity == 0) {
        THROW_INVALID_PARAM("ReportCountCache", "capacity must be > 0");
    }
    if (ttl.count() <= 0) {
        THROW_INVALID_PARAM("ReportCountCache", "ttl must be positive");
    }
    keys_.resize(capacity_);
    values_.resize(capacity_, 0);
    stored_at_.resize(capacity_);
    frequencies_.resize(capacity_, 0);
    timestamps_.resize(capacity_, 0);
    free_slots_.reserve(capacity_);
    for (std::size_t i = capacity_; i > 0; --i) {
        free_slots_.push_back(i - 1);
    }
}

std::chrono::steady_clock::time_point ReportCountCache::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

bool ReportCountCache::expiredLocked(std::size_t slot, std::chrono::steady_clock::time_point t) const {
    return t - stored_at_[slot] >= ttl_;
}

void ReportCountCache::releaseLocked(std::size_t slot) {
    index_.erase(keys_[slot]);
    keys_[slot].clear();
    frequencies_[slot] = 0;
    free_slots_.push_back(slot);
}

// Linear scan over occupied slots: expired entries go first, then LFU with LRU tie-break.
std::size_t ReportCountCache::evictLocked(std::chrono::steady_clock::time_point t) {
    std::size_t victim = 0;
    std::uint32_t min_freq = std::numeric_limits<std::uint32_t>::max();
    std::uint32_t min_time = std::numeric_limits<std::uint32_t>::max();
    bool found_expired = false;

    for (const auto& entry : index_) {
        const std::size_t i = entry.second;
        if (expiredLocked(i, t)) {
            if (!found_expired || timestamps_[i] < min_time) {
                victim = i;
                min_time = timestamps_[i];
            }
            found_expired = true;
            continue;
        }
        if (found_expired) continue;
        if (frequencies_[i] < min_freq || (frequencies_[i] == min_freq && timestamps_[i] < min_time)) {
            min_freq = frequencies_[i];
            min_time = timestamps_[i];
            victim = i;
        }
    }

    if (found_expired) expirations_.fetch_add(1, std::memory_order_relaxed);
    releaseLocked(victim);
    free_slots_.pop_back();
    return victim;
}

std::optional<CachedCount> ReportCountCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    const std::size_t slot = it->second;
    const auto t = now();
    if (expiredLocked(slot, t)) {
        releaseLocked(slot);
        expirations_.fetch_add(1, std::memory_order_relaxed);
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    frequencies_[slot]++;
    timestamps_[slot] = ++current_tick_;
    hits_.fetch_add(1, std::memory_order_relaxed);
    return CachedCount{values_[slot], std::chrono::duration<double>(t - stored_at_[slot]).count()};
}

void ReportCountCache::put(const std::string& key, long long count) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto t = now();
    auto it = index_.find(key);
    if (it != index_.end()) {
        const std::size_t slot = it->second;
        values_[slot] = count;
        stored_at_[slot] = t;
        frequencies_[slot]++;
        timestamps_[slot] = ++current_tick_;
        return;
    }

    std::size_t slot;
    if (free_slots_.empty()) {
        slot = evictLocked(t);
    } else {
        slot = free_slots_.back();
        free_slots_.pop_back();
    }
    keys_[slot] = key;
    values_[slot] = count;
    stored_at_[slot] = t;
    frequencies_[slot] = 1;
    timestamps_[slot] = ++current_tick_;
    index_.emplace(key, slot);
}

void ReportCountCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    index_.clear();
    free_slots_.clear();
    for (std::size_t i = capacity_; i > 0; --i) {
        keys_[i - 1].clear();
        frequencies_[i - 1] = 0;
        free_slots_.push_back(i - 1);
    }
    current_tick_ = 0;
}

std::size_t ReportCountCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

} // namespace ctsafety
