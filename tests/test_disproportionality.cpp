// tests/test_disproportionality.cpp
//
//   T1: PRR and ROR with delta-method intervals on a reference table
//   T2: Haldane-Anscombe correction on zero cells
//   T3: Contingency table from margins; negative cells rejected
//   T4: Composite tier thresholds
//   T5: End-to-end detection of a strong signal
//   T6: Recent-approval annotation and suppression; as_of before approval
//   T7: Unreachable source yields an unavailable result, never a zero signal
//   T8: Batch ordering and ISO date handling
//   T9: Margins and pair table share one caller deadline

#include "exceptions/Exceptions.hpp"
#include "signal/DisproportionalityMetrics.hpp"
#include "signal/SignalDetector.hpp"
#include "support/InMemoryReportingSource.hpp"
#include "utils/Logger.hpp"

#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>

using namespace ctsafety;
using ctsafety::testing::InMemoryReportingSource;

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

bool near(double a, double b, double tol) { return std::abs(a - b) <= tol; }

// a=10, b=990, c=40, d=98920 for NEWCART / CRS.
std::shared_ptr<InMemoryReportingSource> referenceDatabase() {
    auto source = std::make_shared<InMemoryReportingSource>(99960);
    source->addDrug("NEWCART", 1000);
    source->addDrug("CARVYKTI", 1000);
    source->addDrug("BROKEN", 500);
    source->addEvent("CRS", 50);
    source->addEvent("NAUSEA", 5000);
    source->addPair("NEWCART", "CRS", 10);
    source->addPair("CARVYKTI", "CRS", 10);
    source->addPair("CARVYKTI", "NAUSEA", 40);
    source->failDrug("BROKEN");
    return source;
}

std::shared_ptr<ReportingSourceClient> clientFor(std::shared_ptr<IReportingSource> source) {
    ReportingClientOptions options;
    options.max_requests = 1000;
    options.max_retries = 0;
    options.workers = 4;
    return std::make_shared<ReportingSourceClient>(std::move(source), options);
}

int test_reference_ratios() {
    std::cout << "[T1] PRR and ROR reference values\n";
    int failed = 0;
    const ContingencyTable t{10, 990, 40, 98920};

    const RatioEstimate prr = DisproportionalityMetrics::proportionalReportingRatio(t);
    expect(near(prr.value, 24.74, 1e-9), "PRR = 24.74", failed);
    expect(near(prr.lower, 12.40718, 1e-4), "PRR lower 12.407", failed);
    expect(near(prr.upper, 49.33174, 1e-4), "PRR upper 49.332", failed);
    expect(!prr.continuity_corrected, "no correction without zero cells", failed);

    const RatioEstimate ror = DisproportionalityMetrics::reportingOddsRatio(t);
    expect(near(ror.value, 24.97980, 1e-4), "ROR = 24.980", failed);
    expect(near(ror.lower, 12.45713, 1e-4), "ROR lower 12.457", failed);
    expect(near(ror.upper, 50.09100, 1e-4), "ROR upper 50.091", failed);

    const RatioEstimate wide = DisproportionalityMetrics::proportionalReportingRatio(t, 0.99);
    expect(wide.lower < prr.lower && wide.upper > prr.upper, "99% interval wider than 95%", failed);

    bool threw = false;
    try {
        DisproportionalityMetrics::reportingOddsRatio(t, 1.0);
    } catch (const InvalidParameterException&) {
        threw = true;
    }
    expect(threw, "level 1.0 must throw", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_haldane_correction() {
    std::cout << "[T2] zero-cell correction\n";
    int failed = 0;
    const ContingencyTable t{0, 1000, 50, 98910};

    const RatioEstimate prr = DisproportionalityMetrics::proportionalReportingRatio(t);
    const RatioEstimate ror = DisproportionalityMetrics::reportingOddsRatio(t);
    expect(prr.continuity_corrected && ror.continuity_corrected, "both ratios corrected", failed);
    expect(std::isfinite(prr.value) && prr.value > 0.0, "PRR finite", failed);
    expect(std::isfinite(ror.upper), "ROR upper finite", failed);

    const double expected_prr = (0.5 / 1001.0) / (50.5 / 98961.0);
    expect(near(prr.value, expected_prr, 1e-12), "0.5 added to every cell", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_from_margins() {
    std::cout << "[T3] table from margins\n";
    int failed = 0;
    const ContingencyTable t = ContingencyTable::fromMargins(10, 1000, 50, 99960);
    expect(t.a == 10 && t.b == 990 && t.c == 40 && t.d == 98920, "cells derived", failed);
    expect(t.total() == 99960, "total preserved", failed);
    expect(near(t.expectedA(), 1000.0 * 50.0 / 99960.0, 1e-12), "expected count under independence", failed);

    bool threw = false;
    try {
        ContingencyTable::fromMargins(60, 1000, 50, 99960);
    } catch (const DataInconsistencyException&) {
        threw = true;
    }
    expect(threw, "pair count above the event margin must throw", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_classification() {
    std::cout << "[T4] tier thresholds\n";
    int failed = 0;
    const SignalThresholds th;

    RatioEstimate prr{3.0, 1.5, 6.0};
    RatioEstimate ror{3.2, 1.6, 6.4};
    expect(DisproportionalityMetrics::classify(prr, ror, 5, 2.5, th) == SignalTier::Strong, "strong", failed);
    expect(DisproportionalityMetrics::classify(prr, ror, 5, 1.5, th) == SignalTier::Moderate,
           "EB05 below 2 drops to moderate", failed);
    expect(DisproportionalityMetrics::classify(prr, ror, 2, 2.5, th) == SignalTier::Weak,
           "fewer than three cases is at most weak", failed);

    RatioEstimate mild{1.6, 0.8, 3.0};
    RatioEstimate mild_ror{1.6, 0.8, 3.1};
    expect(DisproportionalityMetrics::classify(mild, mild_ror, 10, 0.5, th) == SignalTier::Weak, "PRR 1.6 is weak", failed);
    RatioEstimate flat{1.0, 0.7, 1.4};
    expect(DisproportionalityMetrics::classify(flat, flat, 10, 0.5, th) == SignalTier::None, "no signal", failed);
    expect(DisproportionalityMetrics::classify(flat, flat, 10, 1.2, th) == SignalTier::Weak, "EB05 >= 1 is weak", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_detect_strong_signal() {
    std::cout << "[T5] end-to-end detection\n";
    int failed = 0;
    auto source = referenceDatabase();
    SignalDetector detector(EngineConfiguration::defaults(), clientFor(source));

    const SignalResult r = detector.detect("NEWCART", "CRS", "2025-06-01");
    expect(r.available, "source reachable", failed);
    expect(r.table.a == 10 && r.table.d == 98920, "table from fetched margins", failed);
    expect(near(r.prr.value, 24.74, 1e-9), "PRR matches direct computation", failed);
    expect(r.ebgm > 1.0 && r.eb05 <= r.ebgm && r.ebgm <= r.eb95, "EB05 <= EBGM <= EB95", failed);
    expect(r.tier == SignalTier::Strong, "strong signal", failed);
    expect(r.isSignal(), "isSignal", failed);
    expect(r.diagnostics.hasFlag("mgps_default_prior"), "too few pairs for a fitted prior", failed);
    expect(r.diagnostics.hasFlag("approval_date_unknown"), "unknown product annotated", failed);
    expect(r.diagnostics.values.at("cache_hits") == 0.0, "first call goes to the source", failed);

    const int calls = source->calls();
    const SignalResult again = detector.detect("NEWCART", "CRS", "2025-06-01");
    expect(source->calls() == calls, "second call served from cache", failed);
    expect(again.diagnostics.values.at("cache_hits") == 4.0, "all four margins cached", failed);
    expect(again.prr.value == r.prr.value && again.eb05 == r.eb05, "cached result identical", failed);

    const SignalResult zero = detector.detect("NEWCART", "NAUSEA", "2025-06-01");
    expect(zero.available && zero.table.a == 0, "zero pair count is a real zero", failed);
    expect(zero.diagnostics.hasFlag("haldane_correction"), "zero cell corrected", failed);
    expect(zero.tier == SignalTier::None, "no signal for an absent pair", failed);

    bool threw = false;
    try {
        detector.detect("", "CRS", "2025-06-01");
    } catch (const InvalidParameterException&) {
        threw = true;
    }
    expect(threw, "empty drug must throw", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_recent_approval() {
    std::cout << "[T6] recent approval policy\n";
    int failed = 0;
    auto source = referenceDatabase();
    auto annotate = EngineConfiguration::defaults();
    SignalDetector detector(annotate, clientFor(source));

    const SignalResult recent = detector.detect("CARVYKTI", "CRS", "2023-01-15");
    expect(recent.diagnostics.hasFlag("recent_approval"), "recent approval flagged", failed);
    expect(recent.days_since_approval && *recent.days_since_approval == 321, "days since 2022-02-28", failed);
    expect(!recent.suppressed && recent.tier == recent.raw_tier, "annotate keeps the tier", failed);

    const SignalResult established = detector.detect("CARVYKTI", "CRS", "2025-06-01");
    expect(!established.diagnostics.hasFlag("recent_approval"), "older approval not flagged", failed);

    const SignalResult early = detector.detect("CARVYKTI", "CRS", "2021-01-01");
    expect(early.days_since_approval && *early.days_since_approval < 0, "negative days since approval kept", failed);
    expect(early.diagnostics.hasFlag("as_of_before_approval"), "as_of before approval flagged", failed);
    expect(!early.diagnostics.hasFlag("recent_approval"), "pre-approval date is not a recent approval", failed);

    auto suppress = annotate->withSettings({{"recent_approval_suppress", 1.0}}, "builtin-1-suppress");
    SignalDetector strict(suppress, clientFor(source));
    const SignalResult hidden = strict.detect("CARVYKTI", "CRS", "2023-01-15");
    expect(hidden.suppressed, "suppressed", failed);
    expect(hidden.tier == SignalTier::None && hidden.raw_tier != SignalTier::None, "raw tier retained", failed);
    expect(hidden.diagnostics.hasFlag("suppressed_recent_approval"), "suppression flagged", failed);
    expect(!hidden.isSignal(), "suppressed result is not a signal", failed);

    const SignalResult before = strict.detect("CARVYKTI", "CRS", "2021-01-01");
    expect(!before.suppressed && before.tier == before.raw_tier, "pre-approval date never suppressed", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_unavailable_source() {
    std::cout << "[T7] unavailable source\n";
    int failed = 0;
    auto source = referenceDatabase();
    source->failEverything(true);
    SignalDetector detector(EngineConfiguration::defaults(), clientFor(source));

    const SignalResult r = detector.detect("NEWCART", "CRS", "2025-06-01");
    expect(!r.available, "marked unavailable", failed);
    expect(!r.unavailable_reason.empty(), "reason recorded", failed);
    expect(r.diagnostics.hasFlag("unavailable") && r.diagnostics.hasFlag("source_failed"), "flags set", failed);
    expect(!r.isSignal(), "unavailable is not a signal", failed);
    expect(r.table.a == 0 && r.prr.value == 0.0, "no numbers invented", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_batch_and_dates() {
    std::cout << "[T8] batch ordering and dates\n";
    int failed = 0;
    auto source = referenceDatabase();
    SignalDetector detector(EngineConfiguration::defaults(), clientFor(source));

    const auto results = detector.detectBatch({"BROKEN", "NEWCART"}, {"NAUSEA", "CRS"}, "2025-06-01");
    expect(results.size() == 4, "every combination", failed);
    if (results.size() == 4) {
        expect(results[0].drug == "NEWCART" && results[0].event == "CRS", "signal first", failed);
        expect(results[1].drug == "NEWCART" && results[1].event == "NAUSEA", "available non-signal next", failed);
        expect(!results[2].available && !results[3].available, "unavailable last", failed);
    }

    expect(SignalDetector::daysBetween("2024-02-28", "2024-03-01") == 2, "leap day counted", failed);
    expect(SignalDetector::daysBetween("2024-03-01", "2024-02-28") == -2, "negative span", failed);
    for (const std::string bad : {"2024-02-30", "2024/01/01", "24-01-01", ""}) {
        bool threw = false;
        try {
            SignalDetector::parseIsoDate(bad);
        } catch (const InvalidParameterException&) {
            threw = true;
        }
        expect(threw, "malformed date '" + bad + "' must throw", failed);
    }

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_shared_deadline() {
    std::cout << "[T9] one deadline per detection\n";
    int failed = 0;
    using namespace std::chrono_literals;
    auto source = referenceDatabase();
    source->setDelay(400ms);
    SignalDetector detector(EngineConfiguration::defaults(), clientFor(source));

    const auto start = std::chrono::steady_clock::now();
    const SignalResult r = detector.detect("NEWCART", "CRS", "2025-06-01", 600ms);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    expect(elapsed < 750ms, "detect returns near the caller deadline (" + std::to_string(elapsed.count()) + " ms)", failed);
    expect(r.available, "margins arrived within the budget", failed);
    expect(r.diagnostics.hasFlag("mgps_default_prior"), "pair table past the deadline falls back to the default prior",
           failed);
    expect(source->pairTableCalls() == 1, "pair table requested once", failed);

    bool threw = false;
    try {
        detector.detect("NEWCART", "CRS", "2025-06-01", 0ms);
    } catch (const InvalidParameterException&) {
        threw = true;
    }
    expect(threw, "zero timeout must throw", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

} // namespace

int main() {
    Logger::getInstance().setLogLevel(LogLevel::ERROR);
    int total = 0;
    total += test_reference_ratios();
    total += test_haldane_correction();
    total += test_from_margins();
    total += test_classification();
    total += test_detect_strong_signal();
    total += test_recent_approval();
    total += test_unavailable_source();
    total += test_batch_and_dates();
    total += test_shared_deadline();

    if (total == 0) {
        std::cout << "\nAll disproportionality tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
