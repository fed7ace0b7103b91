#ifndef IN_MEMORY_REPORTING_SOURCE_HPP
#define IN_MEMORY_REPORTING_SOURCE_HPP

#include "exceptions/Exceptions.hpp"
#include "signal/interfaces/IReportingSource.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace ctsafety {
namespace testing {

/**
 * @brief Thread-safe report database held in memory for tests.
 *
 * Counts every call, can delay each answer and can fail queries that mention a given drug.
 */
class InMemoryReportingSource : public IReportingSource {
public:
    explicit InMemoryReportingSource(long long total) : total_(total) {}

    void addDrug(const std::string& drug, long long count) { drugs_[drug] = count; }
    void addEvent(const std::string& event, long long count) { events_[event] = count; }
    void addPair(const std::string& drug, const std::string& event, long long count) {
        pairs_[{drug, event}] = count;
    }

    void failDrug(const std::string& drug) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_drugs_.insert(drug);
    }
    void failEverything(bool fail) { fail_all_ = fail; }
    void setDelay(std::chrono::milliseconds delay) { delay_ms_ = delay.count(); }

    std::string name() const override { return "in-memory"; }

    long long countReports(const ReportQuery& query) override {
        ++calls_;
        const long long delay = delay_ms_.load();
        if (delay > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        if (fail_all_) throw ExternalSourceException("InMemoryReportingSource", "service unavailable");
        if (query.drug) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failing_drugs_.count(*query.drug)) {
                throw ExternalSourceException("InMemoryReportingSource", "query for " + *query.drug + " rejected");
            }
        }
        if (query.drug && query.event) {
            auto it = pairs_.find({*query.drug, *query.event});
            return it == pairs_.end() ? 0 : it->second;
        }
        if (query.drug) {
            auto it = drugs_.find(*query.drug);
            return it == drugs_.end() ? 0 : it->second;
        }
        if (query.event) {
            auto it = events_.find(*query.event);
            return it == events_.end() ? 0 : it->second;
        }
        return total_;
    }

    std::vector<PairCount> pairTable() override {
        ++pair_table_calls_;
        const long long delay = delay_ms_.load();
        if (delay > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        if (fail_all_) throw ExternalSourceException("InMemoryReportingSource", "service unavailable");
        std::vector<PairCount> out;
        for (const auto& [key, observed] : pairs_) {
            out.push_back(PairCount{key.first, key.second, observed, drugs_.at(key.first), events_.at(key.second)});
        }
        return out;
    }

    int calls() const { return calls_.load(); }
    int pairTableCalls() const { return pair_table_calls_.load(); }

private:
    long long total_;
    std::map<std::string, long long> drugs_;
    std::map<std::string, long long> events_;
    std::map<std::pair<std::string, std::string>, long long> pairs_;

    std::mutex mutex_;
    std::set<std::string> failing_drugs_;
    std::atomic<bool> fail_all_{false};
    std::atomic<long long> delay_ms_{0};
    std::atomic<int> calls_{0};
    std::atomic<int> pair_table_calls_{0};
};

} // namespace testing
} // namespace ctsafety

#endif // IN_MEMORY_REPORTING_SOURCE_HPP
