#include "signal/SignalDetector.hpp"
#include "exceptions/Exceptions.hpp"
#include "signal/DisproportionalityMetrics.hpp"
#include "utils/Logger.hpp"

#include <algorithm>
#include <cctype>

namespace ctsafety {

static Logger& logger = Logger::getInstance();
static const std::string LOG_SOURCE = "SIGNAL_DETECTOR";

namespace {

void hashBytes(std::uint64_t& h, const std::string& s) {
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    h ^= 0xff;
    h *= 1099511628211ULL;
}

std::uint64_t fingerprint(const std::vector<PairCount>& pairs, long long n_total) {
    std::uint64_t h = 1469598103934665603ULL;
    hashBytes(h, std::to_string(n_total));
    for (const auto& p : pairs) {
        hashBytes(h, p.drug);
        hashBytes(h, p.event);
        hashBytes(h, std::to_string(p.observed) + "/" + std::to_string(p.drug_total) + "/" +
                     std::to_string(p.event_total));
    }
    return h;
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

SignalDetector::SignalDetector(std::shared_ptr<const EngineConfiguration> config,
                               std::shared_ptr<ReportingSourceClient> client)
    : config_(std::move(config)), client_(std::move(client))
{
    if (!config_) THROW_INVALID_PARAM("SignalDetector", "configuration must not be null");
    if (!client_) THROW_INVALID_PARAM("SignalDetector", "reporting client must not be null");
}

std::chrono::sys_days SignalDetector::parseIsoDate(const std::string& iso) {
    const std::string where = "SignalDetector::parseIsoDate";
    bool shape = iso.size() == 10 && iso[4] == '-' && iso[7] == '-';
    for (std::size_t i = 0; shape && i < iso.size(); ++i) {
        if (i != 4 && i != 7 && !std::isdigit(static_cast<unsigned char>(iso[i]))) shape = false;
    }
    if (!shape) {
        THROW_INVALID_PARAM(where, "expected a YYYY-MM-DD date, got '" + iso + "'");
    }
    const std::chrono::year_month_day ymd{std::chrono::year{std::stoi(iso.substr(0, 4))},
                                          std::chrono::month{static_cast<unsigned>(std::stoi(iso.substr(5, 2)))},
                                          std::chrono::day{static_cast<unsigned>(std::stoi(iso.substr(8, 2)))}};
    if (!ymd.ok()) {
        THROW_INVALID_PARAM(where, "not a calendar date: '" + iso + "'");
    }
    return std::chrono::sys_days{ymd};
}

int SignalDetector::daysBetween(const std::string& from, const std::string& to) {
    return static_cast<int>((parseIsoDate(to) - parseIsoDate(from)).count());
}

std::optional<MgpsFit> SignalDetector::currentFit() const {
    std::lock_guard<std::mutex> lock(fit_mutex_);
    return fit_;
}

MgpsFit SignalDetector::priorFor(long long n_total, Diagnostics& diagnostics, Timeout remaining) {
    const PairTableResult table = client_->pairTable(remaining);
    if (!table.ok()) {
        MgpsFit fallback;
        fallback.prior = MixturePrior::dumouchelDefault();
        fallback.used_default = true;
        fallback.reason = "pair table " + toString(table.status) + (table.error.empty() ? "" : ": " + table.error);
        logger.warning(LOG_SOURCE, "MGPS prior not fitted, " + fallback.reason);
        diagnostics.flag("mgps_default_prior");
        diagnostics.note("MGPS prior: DuMouchel default (" + fallback.reason + ")");
        return fallback;
    }
    if (table.from_cache) {
        diagnostics.values["pair_table_age_seconds"] = table.age_seconds;
    }

    const std::uint64_t fp = fingerprint(table.pairs, n_total);
    std::lock_guard<std::mutex> lock(fit_mutex_);
    if (!fit_ || fit_fingerprint_ != fp) {
        std::vector<PairObservation> observations;
        observations.reserve(table.pairs.size());
        const double n = static_cast<double>(n_total);
        for (const auto& p : table.pairs) {
            observations.push_back(PairObservation{
                p.observed, static_cast<double>(p.drug_total) * static_cast<double>(p.event_total) / n});
        }
        const std::map<std::string, double> settings{
            {"iterations", config_->setting("mgps_iterations", 300)},
            {"cloud_size", config_->setting("mgps_cloud_size", 32)},
            {"seed", config_->setting("mgps_seed", 20240101)}};
        fit_ = GammaPoissonShrinker::fit(observations, settings,
                                         static_cast<int>(config_->setting("mgps_min_pairs", 10)));
        fit_fingerprint_ = fp;
    }
    if (fit_->used_default) {
        diagnostics.flag("mgps_default_prior");
        diagnostics.note("MGPS prior: DuMouchel default (" + fit_->reason + ")");
    } else {
        diagnostics.values["mgps_log_likelihood"] = fit_->log_likelihood;
    }
    diagnostics.values["mgps_pairs"] = fit_->pairs;
    return *fit_;
}

SignalResult SignalDetector::detect(const std::string& drug,
                                    const std::string& event,
                                    const std::string& as_of,
                                    std::optional<Timeout> timeout) {
    if (drug.empty() || event.empty()) {
        THROW_INVALID_PARAM("SignalDetector::detect", "drug and event terms must not be empty");
    }
    parseIsoDate(as_of);

    SignalResult r;
    r.drug = drug;
    r.event = event;
    r.as_of = as_of;
    r.diagnostics.note("source: " + client_->sourceName());

    // Margins and the pair table share one deadline.
    const Timeout budget = timeout.value_or(std::chrono::duration_cast<Timeout>(
        std::chrono::duration<double>(client_->options().timeout_seconds)));
    if (budget.count() <= 0) {
        THROW_INVALID_PARAM("SignalDetector::detect", "timeout must be positive");
    }
    const auto deadline = std::chrono::steady_clock::now() + budget;

    const std::vector<ReportQuery> queries{
        ReportQuery::forPair(drug, event), ReportQuery::forDrug(drug), ReportQuery::forEvent(event), ReportQuery::total()};
    const std::vector<CountResult> counts = client_->countAll(queries, budget);

    double oldest = 0.0;
    int hits = 0;
    int attempts = 0;
    std::string reason;
    for (std::size_t i = 0; i < counts.size(); ++i) {
        const CountResult& c = counts[i];
        if (c.from_cache) ++hits;
        oldest = std::max(oldest, c.age_seconds);
        attempts += c.attempts;
        if (!c.ok()) {
            r.diagnostics.flag("source_" + toString(c.status));
            if (!reason.empty()) reason += "; ";
            reason += queries[i].key() + " " + toString(c.status) + (c.error.empty() ? "" : " (" + c.error + ")");
        }
    }
    r.diagnostics.values["cache_hits"] = hits;
    r.diagnostics.values["oldest_data_age_seconds"] = oldest;
    r.diagnostics.values["source_requests"] = attempts;

    if (!reason.empty()) {
        r.available = false;
        r.unavailable_reason = reason;
        r.diagnostics.flag("unavailable");
        logger.warning(LOG_SOURCE, "Signal for " + drug + "/" + event + " unavailable: " + reason);
        return r;
    }

    r.available = true;
    r.table = ContingencyTable::fromMargins(counts[0].count, counts[1].count, counts[2].count, counts[3].count);

    const double level = config_->setting("signal_confidence_level", 0.95);
    r.prr = DisproportionalityMetrics::proportionalReportingRatio(r.table, level);
    r.ror = DisproportionalityMetrics::reportingOddsRatio(r.table, level);
    if (r.prr.continuity_corrected) {
        r.diagnostics.flag("haldane_correction");
    }

    const double expected = r.table.expectedA();
    r.diagnostics.values["expected_count"] = expected;
    r.diagnostics.values["n_total"] = static_cast<double>(r.table.total());
    if (expected > 0.0) {
        // At least 1 ms so a cached pair table can still be served once the budget is spent.
        const Timeout remaining = std::max(
            Timeout{1}, std::chrono::duration_cast<Timeout>(deadline - std::chrono::steady_clock::now()));
        const MgpsFit fit = priorFor(r.table.total(), r.diagnostics, remaining);
        const EbgmResult eb = GammaPoissonShrinker(fit.prior).evaluate(r.table.a, expected);
        r.ebgm = eb.ebgm;
        r.eb05 = eb.eb05;
        r.eb95 = eb.eb95;
        r.diagnostics.values["posterior_weight1"] = eb.posterior_weight1;
    } else {
        r.diagnostics.flag("ebgm_not_computable");
        r.diagnostics.note("expected count is zero; EBGM not computed");
    }

    r.raw_tier = DisproportionalityMetrics::classify(r.prr, r.ror, r.table.a, r.eb05, config_->signalThresholds());
    r.tier = r.raw_tier;

    std::optional<std::string> approval = config_->approvalDate(drug);
    if (!approval) approval = config_->approvalDate(upper(drug));
    if (approval) {
        const int days = daysBetween(*approval, as_of);
        r.days_since_approval = days;
        const double window = config_->setting("recent_approval_window_days", 730);
        if (days < 0) {
            r.diagnostics.flag("as_of_before_approval");
            r.diagnostics.note("as_of " + as_of + " precedes the " + *approval + " approval of " + drug +
                               "; recent-approval policy not applied");
            logger.warning(LOG_SOURCE, "as_of " + as_of + " precedes approval of " + drug);
        } else if (days < window) {
            r.diagnostics.flag("recent_approval");
            r.diagnostics.note(drug + " approved " + *approval + ", " + std::to_string(days) +
                               " days before " + as_of + "; early post-approval reporting is inflated");
            if (config_->recentApprovalPolicy() == RecentApprovalPolicy::Suppress && r.raw_tier != SignalTier::None) {
                r.tier = SignalTier::None;
                r.suppressed = true;
                r.diagnostics.flag("suppressed_recent_approval");
            }
        }
    } else {
        r.diagnostics.flag("approval_date_unknown");
    }

    logger.info(LOG_SOURCE, drug + "/" + event + ": a=" + std::to_string(r.table.a) + " PRR=" +
                std::to_string(r.prr.value) + " EB05=" + std::to_string(r.eb05) + " tier=" + toString(r.tier));
    return r;
}

std::vector<SignalResult> SignalDetector::detectBatch(const std::vector<std::string>& drugs,
                                                      const std::vector<std::string>& events,
                                                      const std::string& as_of,
                                                      std::optional<Timeout> timeout) {
    std::vector<SignalResult> results;
    results.reserve(drugs.size() * events.size());
    for (const auto& d : drugs) {
        for (const auto& e : events) {
            results.push_back(detect(d, e, as_of, timeout));
        }
    }
    std::stable_sort(results.begin(), results.end(), [](const SignalResult& x, const SignalResult& y) {
        if (x.available != y.available) return x.available;
        if (x.isSignal() != y.isSignal()) return x.isSignal();
        return x.prr.value > y.prr.value;
    });
    return results;
}

} // namespace ctsafety
