#ifndef SIGNAL_TYPES_HPP
#define SIGNAL_TYPES_HPP

#include "safety/SafetyTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ctsafety {

/**
 * @brief 2x2 report table for one drug-event pair.
 *
 *              event   not event
 *   drug         a         b
 *   not drug     c         d
 */
struct ContingencyTable {
    long long a = 0;
    long long b = 0;
    long long c = 0;
    long long d = 0;

    long long total() const { return a + b + c + d; }
    bool hasZeroCell() const { return a == 0 || b == 0 || c == 0 || d == 0; }

    /// Expected count of `a` under independence of drug and event.
    double expectedA() const;

    /**
     * @brief Derive the table from marginal counts.
     * @throws DataInconsistencyException if any derived cell is negative.
     */
    static ContingencyTable fromMargins(long long a, long long drug_total, long long event_total, long long n_total);
};

struct RatioEstimate {
    double value = 0.0;
    double lower = 0.0;
    double upper = 0.0;
    double level = 0.95;
    bool continuity_corrected = false;
};

enum class SignalTier {
    None,
    Weak,
    Moderate,
    Strong
};

std::string toString(SignalTier tier);

/**
 * @brief Query against the reporting database. Empty fields are unrestricted, so a query
 *        with neither drug nor event is the filter-free total.
 */
struct ReportQuery {
    std::optional<std::string> drug;
    std::optional<std::string> event;

    std::string key() const;

    static ReportQuery total() { return ReportQuery{}; }
    static ReportQuery forDrug(std::string d) { return ReportQuery{std::move(d), std::nullopt}; }
    static ReportQuery forEvent(std::string e) { return ReportQuery{std::nullopt, std::move(e)}; }
    static ReportQuery forPair(std::string d, std::string e) { return ReportQuery{std::move(d), std::move(e)}; }
};

/**
 * @brief Observed count and margins of one drug-event pair, for fitting the MGPS prior.
 */
struct PairCount {
    std::string drug;
    std::string event;
    long long observed = 0;
    long long drug_total = 0;
    long long event_total = 0;
};

enum class QueryStatus {
    Ok,
    TimedOut,
    RateLimited,
    Failed
};

std::string toString(QueryStatus status);

/**
 * @brief Outcome of one external count query. Only `Ok` carries a usable count.
 */
struct CountResult {
    QueryStatus status = QueryStatus::Failed;
    long long count = 0;
    bool from_cache = false;
    double age_seconds = 0.0;
    int attempts = 0;
    std::string error;

    bool ok() const { return status == QueryStatus::Ok; }
};

struct PairTableResult {
    QueryStatus status = QueryStatus::Failed;
    std::vector<PairCount> pairs;
    bool from_cache = false;
    double age_seconds = 0.0;
    std::string error;

    bool ok() const { return status == QueryStatus::Ok; }
};

/**
 * @brief Disproportionality result for one drug-event pair.
 *
 * When `available` is false the external source could not be queried and none of the
 * numeric fields are meaningful; this is distinct from a computed tier of None.
 */
struct SignalResult {
    std::string drug;
    std::string event;
    std::string as_of;

    bool available = false;
    std::string unavailable_reason;

    ContingencyTable table;
    RatioEstimate prr;
    RatioEstimate ror;
    double ebgm = 0.0;
    double eb05 = 0.0;
    double eb95 = 0.0;

    SignalTier raw_tier = SignalTier::None;
    SignalTier tier = SignalTier::None;
    bool suppressed = false;
    std::optional<int> days_since_approval;

    Diagnostics diagnostics;

    bool isSignal() const { return available && tier != SignalTier::None; }
};

} // namespace ctsafety

#endif // SIGNAL_TYPES_HPP
