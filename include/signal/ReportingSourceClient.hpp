#ifndef REPORTING_SOURCE_CLIENT_HPP
#define REPORTING_SOURCE_CLIENT_HPP

#include "safety/EngineConfiguration.hpp"
#include "signal/RateLimiter.hpp"
#include "signal/ReportCountCache.hpp"
#include "signal/SignalTypes.hpp"
#include "signal/interfaces/IReportingSource.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace ctsafety {

struct ReportingClientOptions {
    int max_requests = 40;
    double window_seconds = 60.0;
    double cache_ttl_seconds = 86400.0;
    std::size_t cache_capacity = 4096;
    double timeout_seconds = 10.0;
    int max_retries = 3;
    double initial_backoff_seconds = 0.5;
    int workers = 4;

    void validate() const;

    /// Read the "rate_limit_*", "cache_*", "query_*" and "source_workers" settings.
    static ReportingClientOptions fromConfiguration(const EngineConfiguration& config);
};

/**
 * @brief Rate-limited, cached and time-bounded access to an IReportingSource.
 *
 * Queries run on a fixed pool of worker threads so a slow source never blocks the
 * caller beyond its timeout. Each query first consults the TTL cache; on a miss it
 * takes a slot from the shared rate limiter and calls the source, retrying failures
 * with exponential backoff while the deadline allows. Expiry, budget exhaustion and
 * source failure come back as typed CountResult statuses, never as a zero count.
 *
 * A query abandoned by its caller keeps running on the pool and still fills the cache.
 * The destructor waits for running source calls to return.
 */
class ReportingSourceClient {
public:
    using Timeout = std::chrono::milliseconds;

    /**
     * @param source  External database; must be thread-safe.
     * @param options Budget, cache, retry and pool settings.
     * @param clock   Time source for cache ages and expiry (tests inject a manual clock).
     */
    ReportingSourceClient(std::shared_ptr<IReportingSource> source,
                          ReportingClientOptions options,
                          ReportCountCache::Clock clock = {});
    ~ReportingSourceClient();

    ReportingSourceClient(const ReportingSourceClient&) = delete;
    ReportingSourceClient& operator=(const ReportingSourceClient&) = delete;
    ReportingSourceClient(ReportingSourceClient&&) = delete;
    ReportingSourceClient& operator=(ReportingSourceClient&&) = delete;

    /// @param timeout Caller deadline; defaults to options().timeout_seconds.
    CountResult count(const ReportQuery& query, std::optional<Timeout> timeout = std::nullopt);

    /// Issue all queries concurrently under one shared deadline; results keep input order.
    std::vector<CountResult> countAll(const std::vector<ReportQuery>& queries,
                                      std::optional<Timeout> timeout = std::nullopt);

    /// Pair table of the whole database, cached under the same TTL as counts.
    PairTableResult pairTable(std::optional<Timeout> timeout = std::nullopt);

    std::string sourceName() const { return source_->name(); }
    const ReportingClientOptions& options() const { return options_; }
    const ReportCountCache& cache() const { return cache_; }
    const RateLimiter& rateLimiter() const { return limiter_; }
    std::size_t pendingTaskCount() const;

private:
    using Deadline = std::chrono::steady_clock::time_point;

    Deadline deadlineFor(std::optional<Timeout> timeout) const;
    std::chrono::steady_clock::time_point now() const;

    void workerLoop();
    void enqueueTask(std::function<void()> task);

    template <typename T>
    std::future<T> submit(std::function<T()> work) {
        auto task = std::make_shared<std::packaged_task<T()>>(std::move(work));
        std::future<T> future = task->get_future();
        enqueueTask([task]() { (*task)(); });
        return future;
    }

    CountResult fetchCount(const ReportQuery& query, Deadline deadline);
    PairTableResult fetchPairTable(Deadline deadline);
    bool backoffBeforeRetry(int attempt, Deadline deadline) const;

    std::shared_ptr<IReportingSource> source_;
    ReportingClientOptions options_;
    ReportCountCache::Clock clock_;
    RateLimiter limiter_;
    ReportCountCache cache_;

    mutable std::mutex pair_table_mutex_;
    std::optional<std::vector<PairCount>> pair_table_;
    std::chrono::steady_clock::time_point pair_table_at_;

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::atomic<bool> stop_flag_{false};
};

} // namespace ctsafety

#endif // REPORTING_SOURCE_CLIENT_HPP
