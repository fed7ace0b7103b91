// tests/test_reporting_client.cpp
//
//   T1: Rolling-window rate limiter grants, denials and waiting
//   T2: TTL cache expiry and eviction order
//   T3: Client answers repeated queries from the cache until the TTL passes
//   T4: Exhausted request budget is reported as RateLimited
//   T5: Slow source times out but still fills the cache
//   T6: Failing source is retried, then reported as Failed and never as zero
//   T7: Concurrent queries keep their input order
//   T8: Pair table caching
//   T9: Option validation and configuration mapping

#include "exceptions/Exceptions.hpp"
#include "signal/RateLimiter.hpp"
#include "signal/ReportCountCache.hpp"
#include "signal/ReportingSourceClient.hpp"
#include "support/InMemoryReportingSource.hpp"
#include "utils/Logger.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace ctsafety;
using ctsafety::testing::InMemoryReportingSource;
using namespace std::chrono_literals;

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

/// Clock that only moves when the test advances it.
struct ManualClock {
    std::shared_ptr<std::atomic<long long>> millis = std::make_shared<std::atomic<long long>>(1000);

    ReportCountCache::Clock function() const {
        auto m = millis;
        return [m]() { return std::chrono::steady_clock::time_point(std::chrono::milliseconds(m->load())); };
    }
    void advance(std::chrono::milliseconds by) { millis->fetch_add(by.count()); }
};

std::shared_ptr<InMemoryReportingSource> smallDatabase() {
    auto source = std::make_shared<InMemoryReportingSource>(100000);
    source->addDrug("KYMRIAH", 6200);
    source->addDrug("YESCARTA", 9800);
    source->addEvent("CRS", 14500);
    source->addPair("KYMRIAH", "CRS", 1180);
    source->addPair("YESCARTA", "CRS", 2150);
    return source;
}

ReportingClientOptions fastOptions() {
    ReportingClientOptions o;
    o.max_requests = 100;
    o.window_seconds = 60.0;
    o.cache_ttl_seconds = 10.0;
    o.timeout_seconds = 5.0;
    o.max_retries = 0;
    o.initial_backoff_seconds = 0.01;
    o.workers = 4;
    return o;
}

int test_rate_limiter() {
    std::cout << "[T1] rate limiter\n";
    int failed = 0;

    RateLimiter limiter(3, std::chrono::milliseconds(60000));
    expect(limiter.tryAcquire() && limiter.tryAcquire() && limiter.tryAcquire(), "three grants", failed);
    expect(!limiter.tryAcquire(), "fourth denied", failed);
    expect(limiter.available() == 0, "no slots left", failed);
    expect(!limiter.acquire(RateLimiter::Clock::now() + 10ms), "cannot wait a whole window", failed);
    expect(limiter.granted() == 3 && limiter.denied() == 2, "grant and denial counters", failed);

    RateLimiter fast(2, std::chrono::milliseconds(50));
    const auto start = RateLimiter::Clock::now();
    expect(fast.acquire(start + 1s) && fast.acquire(start + 1s), "two immediate grants", failed);
    expect(fast.acquire(start + 1s), "third grant after the window rolls", failed);
    expect(RateLimiter::Clock::now() - start >= 50ms, "third grant waited for the window", failed);

    bool threw = false;
    try {
        RateLimiter bad(0, std::chrono::milliseconds(1000));
    } catch (const InvalidParameterException&) {
        threw = true;
    }
    expect(threw, "zero budget rejected", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_cache() {
    std::cout << "[T2] TTL cache\n";
    int failed = 0;
    ManualClock clock;

    ReportCountCache cache(2, std::chrono::milliseconds(1000), clock.function());
    cache.put("a", 10);
    clock.advance(400ms);
    auto hit = cache.get("a");
    expect(hit && hit->count == 10, "hit before expiry", failed);
    expect(hit && std::abs(hit->age_seconds - 0.4) < 1e-9, "age reported", failed);
    clock.advance(600ms);
    expect(!cache.get("a"), "entry expires at the TTL", failed);
    expect(cache.expirations() == 1 && cache.size() == 0, "expired entry removed", failed);

    cache.put("a", 1);
    cache.put("b", 2);
    cache.get("a");
    cache.put("c", 3);
    expect(!cache.get("b"), "least frequently used entry evicted", failed);
    expect(cache.get("a") && cache.get("c"), "other entries kept", failed);

    ReportCountCache aging(2, std::chrono::milliseconds(1000), clock.function());
    aging.put("x", 1);
    aging.get("x");
    aging.get("x");
    clock.advance(500ms);
    aging.put("y", 2);
    clock.advance(700ms);
    aging.put("z", 3);
    expect(aging.get("y") && aging.get("z"), "expired entry evicted before live ones", failed);
    expect(!aging.get("x"), "frequent but expired entry gone", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_client_cache() {
    std::cout << "[T3] client cache\n";
    int failed = 0;
    ManualClock clock;
    auto source = smallDatabase();
    ReportingSourceClient client(source, fastOptions(), clock.function());

    const CountResult first = client.count(ReportQuery::forPair("KYMRIAH", "CRS"));
    expect(first.ok() && first.count == 1180 && !first.from_cache, "first answer from the source", failed);
    expect(first.attempts == 1, "one attempt", failed);

    clock.advance(4000ms);
    const CountResult second = client.count(ReportQuery::forPair("KYMRIAH", "CRS"));
    expect(second.ok() && second.from_cache && second.count == 1180, "second answer cached", failed);
    expect(std::abs(second.age_seconds - 4.0) < 1e-9, "cached age reported", failed);
    expect(source->calls() == 1, "source queried once", failed);

    clock.advance(7000ms);
    const CountResult third = client.count(ReportQuery::forPair("KYMRIAH", "CRS"));
    expect(third.ok() && !third.from_cache, "expired entry refetched", failed);
    expect(source->calls() == 2, "source queried again", failed);

    const CountResult unknown = client.count(ReportQuery::forPair("KYMRIAH", "NAUSEA"));
    expect(unknown.ok() && unknown.count == 0, "no matching reports is a real zero", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_rate_limited() {
    std::cout << "[T4] budget exhaustion\n";
    int failed = 0;
    auto source = smallDatabase();
    ReportingClientOptions options = fastOptions();
    options.max_requests = 2;
    ReportingSourceClient client(source, options);

    const auto results = client.countAll({ReportQuery::forDrug("KYMRIAH"), ReportQuery::forDrug("YESCARTA"),
                                          ReportQuery::forEvent("CRS")},
                                         200ms);
    int ok = 0;
    int limited = 0;
    for (const auto& r : results) {
        if (r.ok()) ++ok;
        if (r.status == QueryStatus::RateLimited) {
            ++limited;
            expect(r.count == 0 && !r.error.empty(), "rate-limited result carries no count", failed);
        }
    }
    expect(ok == 2 && limited == 1, "two answered, one rate limited", failed);
    expect(source->calls() == 2, "budget respected", failed);
    expect(client.rateLimiter().denied() == 1, "denial counted", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_timeout() {
    std::cout << "[T5] caller timeout\n";
    int failed = 0;
    auto source = smallDatabase();
    source->setDelay(300ms);
    ReportingSourceClient client(source, fastOptions());

    const auto start = std::chrono::steady_clock::now();
    const CountResult r = client.count(ReportQuery::total(), 50ms);
    const auto waited = std::chrono::steady_clock::now() - start;
    expect(r.status == QueryStatus::TimedOut, "timed out", failed);
    expect(!r.ok() && r.count == 0, "no count on timeout", failed);
    expect(waited < 250ms, "caller not blocked by the slow source", failed);

    std::this_thread::sleep_for(500ms);
    source->setDelay(0ms);
    const CountResult later = client.count(ReportQuery::total());
    expect(later.ok() && later.from_cache && later.count == 100000, "abandoned query filled the cache", failed);

    bool threw = false;
    try {
        client.count(ReportQuery::total(), 0ms);
    } catch (const InvalidParameterException&) {
        threw = true;
    }
    expect(threw, "non-positive timeout rejected", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_failures() {
    std::cout << "[T6] failing source\n";
    int failed = 0;
    auto source = smallDatabase();
    source->failEverything(true);
    ReportingClientOptions options = fastOptions();
    options.max_retries = 2;
    ReportingSourceClient client(source, options);

    const CountResult r = client.count(ReportQuery::forDrug("KYMRIAH"));
    expect(r.status == QueryStatus::Failed, "reported as failed", failed);
    expect(r.attempts == 3 && source->calls() == 3, "initial attempt plus two retries", failed);
    expect(!r.error.empty(), "error text kept", failed);
    expect(!r.ok(), "failure is not a usable zero", failed);
    expect(client.cache().size() == 0, "failures are not cached", failed);

    source->failEverything(false);
    const CountResult recovered = client.count(ReportQuery::forDrug("KYMRIAH"));
    expect(recovered.ok() && recovered.count == 6200, "recovers once the source does", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_order() {
    std::cout << "[T7] result order\n";
    int failed = 0;
    auto source = smallDatabase();
    source->setDelay(20ms);
    ReportingSourceClient client(source, fastOptions());

    const std::vector<ReportQuery> queries = {ReportQuery::forPair("YESCARTA", "CRS"), ReportQuery::forDrug("KYMRIAH"),
                                              ReportQuery::forEvent("CRS"), ReportQuery::total(),
                                              ReportQuery::forPair("KYMRIAH", "CRS")};
    const auto results = client.countAll(queries);
    const std::vector<long long> expected = {2150, 6200, 14500, 100000, 1180};
    expect(results.size() == expected.size(), "one result per query", failed);
    for (std::size_t i = 0; i < results.size() && i < expected.size(); ++i) {
        expect(results[i].ok() && results[i].count == expected[i], "result " + std::to_string(i) + " in order", failed);
    }
    expect(client.pendingTaskCount() == 0, "queue drained", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_pair_table() {
    std::cout << "[T8] pair table\n";
    int failed = 0;
    ManualClock clock;
    auto source = smallDatabase();
    ReportingSourceClient client(source, fastOptions(), clock.function());

    const PairTableResult first = client.pairTable();
    expect(first.ok() && first.pairs.size() == 2 && !first.from_cache, "table fetched", failed);
    clock.advance(2000ms);
    const PairTableResult second = client.pairTable();
    expect(second.ok() && second.from_cache && std::abs(second.age_seconds - 2.0) < 1e-9, "table cached", failed);
    expect(source->pairTableCalls() == 1, "fetched once", failed);
    clock.advance(9000ms);
    const PairTableResult third = client.pairTable();
    expect(third.ok() && !third.from_cache && source->pairTableCalls() == 2, "refetched after the TTL", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_options() {
    std::cout << "[T9] options\n";
    int failed = 0;

    auto rejects = [](ReportingClientOptions o) {
        try {
            o.validate();
        } catch (const InvalidParameterException&) {
            return true;
        }
        return false;
    };
    ReportingClientOptions o = fastOptions();
    o.workers = 0;
    expect(rejects(o), "zero workers", failed);
    o = fastOptions();
    o.window_seconds = 0.0;
    expect(rejects(o), "zero window", failed);
    o = fastOptions();
    o.max_retries = -1;
    expect(rejects(o), "negative retries", failed);
    expect(!rejects(fastOptions()), "valid options accepted", failed);

    auto config = EngineConfiguration::defaults()->withSettings(
        {{"rate_limit_requests", 7}, {"cache_ttl_seconds", 120}, {"source_workers", 2}}, "client-test");
    const ReportingClientOptions mapped = ReportingClientOptions::fromConfiguration(*config);
    expect(mapped.max_requests == 7 && mapped.cache_ttl_seconds == 120.0 && mapped.workers == 2, "settings mapped", failed);
    expect(mapped.window_seconds == 60.0 && mapped.max_retries == 3, "defaults kept", failed);

    bool threw = false;
    try {
        ReportingSourceClient client(nullptr, fastOptions());
    } catch (const InvalidParameterException&) {
        threw = true;
    }
    expect(threw, "null source rejected", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

} // namespace

int main() {
    Logger::getInstance().setLogLevel(LogLevel::ERROR);
    int total = 0;
    total += test_rate_limiter();
    total += test_cache();
    total += test_client_cache();
    total += test_rate_limited();
    total += test_timeout();
    total += test_failures();
    total += test_order();
    total += test_pair_table();
    total += test_options();

    if (total == 0) {
        std::cout << "\nAll reporting client tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
