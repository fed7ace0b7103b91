#include "signal/ReportingSourceClient.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

#include <cmath>

namespace ctsafety {

static Logger& logger = Logger::getInstance();
static const std::string LOG_SOURCE = "REPORTING_CLIENT";

namespace {

std::chrono::milliseconds toMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

ReportingClientOptions checked(ReportingClientOptions options) {
    options.validate();
    return options;
}

} // namespace

void ReportingClientOptions::validate() const {
    const std::string where = "ReportingClientOptions";
    if (max_requests < 1) THROW_INVALID_PARAM(where, "rate_limit_requests must be >= 1");
    if (!(window_seconds > 0.0)) THROW_INVALID_PARAM(where, "rate_limit_window_seconds must be positive");
    if (!(cache_ttl_seconds > 0.0)) THROW_INVALID_PARAM(where, "cache_ttl_seconds must be positive");
    if (cache_capacity == 0) THROW_INVALID_PARAM(where, "cache_capacity must be >= 1");
    if (!(timeout_seconds > 0.0)) THROW_INVALID_PARAM(where, "query_timeout_seconds must be positive");
    if (max_retries < 0) THROW_INVALID_PARAM(where, "query_max_retries must be >= 0");
    if (initial_backoff_seconds < 0.0) THROW_INVALID_PARAM(where, "query_initial_backoff_seconds must be >= 0");
    if (workers < 1) THROW_INVALID_PARAM(where, "source_workers must be >= 1");
}

ReportingClientOptions ReportingClientOptions::fromConfiguration(const EngineConfiguration& config) {
    ReportingClientOptions o;
    o.max_requests = static_cast<int>(config.setting("rate_limit_requests", o.max_requests));
    o.window_seconds = config.setting("rate_limit_window_seconds", o.window_seconds);
    o.cache_ttl_seconds = config.setting("cache_ttl_seconds", o.cache_ttl_seconds);
    o.cache_capacity = static_cast<std::size_t>(config.setting("cache_capacity", static_cast<double>(o.cache_capacity)));
    o.timeout_seconds = config.setting("query_timeout_seconds", o.timeout_seconds);
    o.max_retries = static_cast<int>(config.setting("query_max_retries", o.max_retries));
    o.initial_backoff_seconds = config.setting("query_initial_backoff_seconds", o.initial_backoff_seconds);
    o.workers = static_cast<int>(config.setting("source_workers", o.workers));
    o.validate();
    return o;
}

ReportingSourceClient::ReportingSourceClient(std::shared_ptr<IReportingSource> source,
                                             ReportingClientOptions options,
                                             ReportCountCache::Clock clock)
    : source_(std::move(source)),
      options_(checked(std::move(options))),
      clock_(clock),
      limiter_(options_.max_requests, toMillis(options_.window_seconds)),
      cache_(options_.cache_capacity, toMillis(options_.cache_ttl_seconds), std::move(clock))
{
    if (!source_) {
        THROW_INVALID_PARAM("ReportingSourceClient", "reporting source must not be null");
    }
    try {
        workers_.reserve(static_cast<std::size_t>(options_.workers));
        for (int i = 0; i < options_.workers; ++i) {
            workers_.emplace_back(&ReportingSourceClient::workerLoop, this);
        }
    } catch (const std::exception& e) {
        logger.error(LOG_SOURCE, std::string("Failed to start worker threads: ") + e.what());
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            stop_flag_ = true;
        }
        queue_cv_.notify_all();
        for (auto& w : workers_) {
            if (w.joinable()) w.join();
        }
        throw;
    }
    logger.info(LOG_SOURCE, "Client for '" + source_->name() + "' started with " +
                std::to_string(options_.workers) + " workers, budget " +
                std::to_string(options_.max_requests) + " requests per " +
                std::to_string(options_.window_seconds) + " s");
}

ReportingSourceClient::~ReportingSourceClient() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_flag_ = true;
    }
    queue_cv_.notify_all();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
    logger.debug(LOG_SOURCE, "Client for '" + source_->name() + "' shut down");
}

void ReportingSourceClient::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return stop_flag_ || !task_queue_.empty();
            });
            if (stop_flag_ && task_queue_.empty()) {
                break;
            }
            task = std::move(task_queue_.front());
            task_queue_.pop();
        }
        // Tasks are packaged_tasks; their exceptions land in the caller's future.
        task();
    }
}

void ReportingSourceClient::enqueueTask(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
}

std::size_t ReportingSourceClient::pendingTaskCount() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.size();
}

std::chrono::steady_clock::time_point ReportingSourceClient::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

ReportingSourceClient::Deadline ReportingSourceClient::deadlineFor(std::optional<Timeout> timeout) const {
    const Timeout t = timeout.value_or(toMillis(options_.timeout_seconds));
    if (t.count() <= 0) {
        THROW_INVALID_PARAM("ReportingSourceClient", "timeout must be positive");
    }
    return std::chrono::steady_clock::now() + t;
}

bool ReportingSourceClient::backoffBeforeRetry(int attempt, Deadline deadline) const {
    if (attempt >= options_.max_retries || stop_flag_) return false;
    const double delay = options_.initial_backoff_seconds * std::pow(2.0, attempt);
    const auto wake = std::chrono::steady_clock::now() + toMillis(delay);
    if (wake >= deadline) return false;
    std::this_thread::sleep_until(wake);
    return true;
}

CountResult ReportingSourceClient::fetchCount(const ReportQuery& query, Deadline deadline) {
    CountResult result;
    for (int attempt = 0;; ++attempt) {
        if (!limiter_.acquire(deadline)) {
            result.status = QueryStatus::RateLimited;
            result.error = "request budget exhausted before deadline";
            return result;
        }
        result.attempts = attempt + 1;
        try {
            const long long n = source_->countReports(query);
            if (n >= 0) {
                cache_.put(query.key(), n);
                result.status = QueryStatus::Ok;
                result.count = n;
                result.error.clear();
                return result;
            }
            result.error = "source returned a negative count";
        } catch (const std::exception& e) {
            result.error = e.what();
        }
        logger.warning(LOG_SOURCE, "Query " + query.key() + " failed (attempt " + std::to_string(attempt + 1) +
                       "): " + result.error);
        if (!backoffBeforeRetry(attempt, deadline)) break;
    }
    result.status = QueryStatus::Failed;
    return result;
}

CountResult ReportingSourceClient::count(const ReportQuery& query, std::optional<Timeout> timeout) {
    return countAll({query}, timeout).front();
}

std::vector<CountResult> ReportingSourceClient::countAll(const std::vector<ReportQuery>& queries,
                                                         std::optional<Timeout> timeout) {
    const Deadline deadline = deadlineFor(timeout);
    std::vector<CountResult> results(queries.size());
    std::vector<std::optional<std::future<CountResult>>> pending(queries.size());

    for (std::size_t i = 0; i < queries.size(); ++i) {
        if (auto cached = cache_.get(queries[i].key())) {
            results[i].status = QueryStatus::Ok;
            results[i].count = cached->count;
            results[i].from_cache = true;
            results[i].age_seconds = cached->age_seconds;
            continue;
        }
        const ReportQuery q = queries[i];
        pending[i] = submit<CountResult>([this, q, deadline]() { return fetchCount(q, deadline); });
    }

    for (std::size_t i = 0; i < queries.size(); ++i) {
        if (!pending[i]) continue;
        std::future<CountResult>& f = *pending[i];
        if (f.wait_until(deadline) == std::future_status::ready) {
            results[i] = f.get();
        } else {
            results[i].status = QueryStatus::TimedOut;
            results[i].error = "no answer within the caller timeout";
            logger.warning(LOG_SOURCE, "Query " + queries[i].key() + " timed out");
        }
    }
    return results;
}

PairTableResult ReportingSourceClient::fetchPairTable(Deadline deadline) {
    PairTableResult result;
    for (int attempt = 0;; ++attempt) {
        if (!limiter_.acquire(deadline)) {
            result.status = QueryStatus::RateLimited;
            result.error = "request budget exhausted before deadline";
            return result;
        }
        try {
            result.pairs = source_->pairTable();
            result.status = QueryStatus::Ok;
            result.error.clear();
            std::lock_guard<std::mutex> lock(pair_table_mutex_);
            pair_table_ = result.pairs;
            pair_table_at_ = now();
            return result;
        } catch (const std::exception& e) {
            result.error = e.what();
        }
        logger.warning(LOG_SOURCE, "Pair table query failed (attempt " + std::to_string(attempt + 1) +
                       "): " + result.error);
        if (!backoffBeforeRetry(attempt, deadline)) break;
    }
    result.status = QueryStatus::Failed;
    return result;
}

PairTableResult ReportingSourceClient::pairTable(std::optional<Timeout> timeout) {
    const Deadline deadline = deadlineFor(timeout);
    {
        std::lock_guard<std::mutex> lock(pair_table_mutex_);
        if (pair_table_) {
            const auto age = now() - pair_table_at_;
            if (age < toMillis(options_.cache_ttl_seconds)) {
                PairTableResult cached;
                cached.status = QueryStatus::Ok;
                cached.pairs = *pair_table_;
                cached.from_cache = true;
                cached.age_seconds = std::chrono::duration<double>(age).count();
                return cached;
            }
            pair_table_.reset();
        }
    }

    std::future<PairTableResult> f = submit<PairTableResult>([this, deadline]() { return fetchPairTable(deadline); });
    if (f.wait_until(deadline) == std::future_status::ready) {
        return f.get();
    }
    PairTableResult timed_out;
    timed_out.status = QueryStatus::TimedOut;
    timed_out.error = "no answer within the caller timeout";
    logger.warning(LOG_SOURCE, "Pair table query timed out");
    return timed_out;
}

} // namespace ctsafety
