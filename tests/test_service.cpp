// tests/test_service.cpp
//
//   T1: Risk estimation through the registry carries provenance
//   T2: Evidence accrual with the configured projection horizon
//   T3: Stopping boundary defaults and overrides
//   T4: Signal detection requires a reporting source
//   T5: Mitigation combination records seed and sample count
//   T6: Method listing and comparison with failing methods
//   T7: Concurrent estimation against one configuration version

#include "exceptions/Exceptions.hpp"
#include "service/SafetyRiskService.hpp"
#include "support/InMemoryReportingSource.hpp"
#include "utils/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace ctsafety;
using ctsafety::testing::InMemoryReportingSource;

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

template <typename Exception, typename Fn>
bool throwsAs(Fn fn) {
    try {
        fn();
    } catch (const Exception&) {
        return true;
    }
    return false;
}

bool contains(const std::vector<std::string>& items, const std::string& item) {
    return std::find(items.begin(), items.end(), item) != items.end();
}

std::vector<AdverseEventObservation> sleTimeline() {
    return {
        {AdverseEventType::CRS, 0, 5, "SLE-CART", Timepoint{1, "2022 Q3"}, "CD19-CAR-T"},
        {AdverseEventType::CRS, 0, 20, "SLE-CART", Timepoint{2, "2023 Q4"}, "CD19-CAR-T"},
        {AdverseEventType::CRS, 1, 37, "SLE-CART", Timepoint{3, "2024 Q2"}, "CD19-CAR-T"},
        {AdverseEventType::CRS, 1, 47, "SLE-CART", Timepoint{4, "2025 Q1"}, "CD19-CAR-T"},
        {AdverseEventType::ICANS, 0, 47, "SLE-CART", Timepoint{4, "2025 Q1"}, "CD19-CAR-T"},
    };
}

int test_estimate_risk() {
    std::cout << "[T1] estimate risk\n";
    int failed = 0;
    SafetyRiskService service(EngineConfiguration::defaults());

    EstimationRequest req;
    req.observations = sleTimeline();
    const RiskEstimateResponse r = service.estimateRisk(AdverseEventType::CRS, req, "bayesian_beta_binomial");
    expect(std::abs(r.estimate.point - 1.21 / 48.5) < 1e-12, "posterior mean from the latest cumulative count", failed);
    expect(r.estimate.interval.lower < r.estimate.point && r.estimate.point < r.estimate.interval.upper,
           "point inside its interval", failed);
    expect(r.provenance.operation == "estimate_risk", "operation recorded", failed);
    expect(r.provenance.method == "bayesian_beta_binomial", "method recorded", failed);
    expect(r.provenance.configuration_version == "builtin-1", "configuration version recorded", failed);
    expect(r.provenance.inputs.at("adverse_event_type") == "CRS", "type recorded", failed);
    expect(r.provenance.inputs.at("observations") == "5", "observation count recorded", failed);
    expect(r.provenance.inputs.count("n_new") == 0, "unused options omitted", failed);

    req.options.n_new = 30;
    const RiskEstimateResponse pred = service.estimateRisk(AdverseEventType::CRS, req, "predictive_posterior");
    expect(pred.provenance.inputs.at("n_new") == "30", "cohort size recorded", failed);
    expect(pred.estimate.distribution.size() == 31, "predictive PMF over 0..30", failed);

    expect(throwsAs<InvalidParameterException>([&] { service.estimateRisk(AdverseEventType::CRS, req, "bootstrap"); }),
           "unknown method must throw", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_evidence_accrual() {
    std::cout << "[T2] evidence accrual\n";
    int failed = 0;
    SafetyRiskService service(EngineConfiguration::defaults());

    const AccrualResponse r = service.evidenceAccrual(AdverseEventType::CRS, sleTimeline());
    expect(r.points.size() == 5, "four timepoints plus one projection", failed);
    if (r.points.size() == 5) {
        expect(r.points.back().is_projected && r.points.back().cumulative_n == 97, "default horizon of 50", failed);
        expect(!r.points[3].is_projected && r.points[3].cumulative_n == 47, "observed points kept", failed);
    }
    expect(r.provenance.inputs.at("projection_horizon") == "50", "horizon recorded", failed);
    expect(r.provenance.inputs.at("timepoints") == "4", "only CRS timepoints counted", failed);
    expect(r.provenance.inputs.at("prior") == "Beta(0.21, 1.29)", "prior recorded", failed);
    expect(contains(r.provenance.approximations, "projection_at_posterior_mean"), "projection flagged", failed);

    const AccrualResponse none = service.evidenceAccrual(AdverseEventType::CRS, sleTimeline(), 0);
    expect(none.points.size() == 4, "horizon 0 projects nothing", failed);
    expect(!contains(none.provenance.approximations, "projection_at_posterior_mean"), "no projection flag", failed);

    expect(throwsAs<InvalidParameterException>([&] { service.evidenceAccrual(AdverseEventType::HLH, sleTimeline()); }),
           "type without observations must throw", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_stopping_boundary() {
    std::cout << "[T3] stopping boundary\n";
    int failed = 0;
    SafetyRiskService service(EngineConfiguration::defaults());

    const StoppingBoundaryResponse r = service.stoppingBoundary(AdverseEventType::CRS, 40);
    expect(std::abs(r.target_rate - 0.05) < 1e-12, "configured target rate", failed);
    expect(std::abs(r.probability_threshold - 0.8) < 1e-12, "default probability threshold", failed);
    expect(r.boundary.size() == 40, "one point per n", failed);
    expect(!r.transitions.empty() && r.transitions.front().n == 1, "transitions start at n = 1", failed);
    for (std::size_t i = 1; i < r.boundary.size(); ++i) {
        expect(r.boundary[i].max_tolerable_events >= r.boundary[i - 1].max_tolerable_events, "monotone boundary", failed);
    }
    expect(r.provenance.inputs.at("max_n") == "40", "max_n recorded", failed);

    const StoppingBoundaryResponse loose = service.stoppingBoundary(AdverseEventType::CRS, 40, 0.95, 0.10);
    expect(std::abs(loose.target_rate - 0.10) < 1e-12 && std::abs(loose.probability_threshold - 0.95) < 1e-12,
           "overrides applied", failed);
    expect(loose.boundary.back().max_tolerable_events >= r.boundary.back().max_tolerable_events,
           "looser rule tolerates at least as many events", failed);

    expect(throwsAs<InvalidParameterException>([&] { service.stoppingBoundary(AdverseEventType::CRS, 0); }),
           "max_n 0 must throw", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_detect_signal() {
    std::cout << "[T4] signal detection\n";
    int failed = 0;

    SafetyRiskService offline(EngineConfiguration::defaults());
    expect(!offline.hasReportingSource(), "no source configured", failed);
    expect(throwsAs<ExternalSourceException>([&] { offline.detectSignal("NEWCART", "CRS", "2025-06-01"); }),
           "detection without a source must throw", failed);

    auto source = std::make_shared<InMemoryReportingSource>(99960);
    source->addDrug("NEWCART", 1000);
    source->addEvent("CRS", 50);
    source->addEvent("NAUSEA", 5000);
    source->addPair("NEWCART", "CRS", 10);

    SafetyRiskService service(EngineConfiguration::defaults(), source);
    expect(service.hasReportingSource(), "source configured", failed);

    const SignalResponse r = service.detectSignal("NEWCART", "CRS", "2025-06-01");
    expect(r.signal.available && r.signal.tier == SignalTier::Strong, "strong signal", failed);
    expect(r.provenance.operation == "detect_signal" && r.provenance.method == "prr_ror_mgps", "operation recorded", failed);
    expect(r.provenance.inputs.at("source") == "in-memory", "source recorded", failed);
    expect(contains(r.provenance.approximations, "mgps_default_prior"), "detector flags carried", failed);

    const auto batch = service.detectSignals({"NEWCART"}, {"CRS", "NAUSEA"}, "2025-06-01");
    expect(batch.size() == 2, "one response per pair", failed);
    if (batch.size() == 2) {
        expect(batch[0].provenance.inputs.at("event") == "CRS" && batch[1].provenance.inputs.at("event") == "NAUSEA",
               "signals ranked first", failed);
        expect(batch[1].signal.tier == SignalTier::None, "absent pair is not a signal", failed);
    }

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_combine_mitigations() {
    std::cout << "[T5] combine mitigations\n";
    int failed = 0;
    SafetyRiskService service(EngineConfiguration::defaults());

    const MitigationResponse r = service.combineMitigations({"tocilizumab", "anakinra"}, AdverseEventType::CRS,
                                                            sleTimeline(), 7ULL, 2000);
    expect(r.result.applied_strategies.size() == 2, "both strategies applied", failed);
    expect(r.result.combined_rr > r.result.naive_product, "correlation weakens the combined effect", failed);
    expect(r.provenance.inputs.at("strategies") == "tocilizumab,anakinra", "strategies recorded", failed);
    expect(r.provenance.inputs.at("seed") == "7", "seed recorded", failed);
    expect(r.provenance.inputs.at("samples") == "2000", "sample count recorded", failed);
    expect(contains(r.provenance.approximations, "monte_carlo"), "Monte Carlo flagged", failed);

    const MitigationResponse again = service.combineMitigations({"tocilizumab", "anakinra"}, AdverseEventType::CRS,
                                                                sleTimeline(), 7ULL, 2000);
    expect(again.result.risk_distribution.median == r.result.risk_distribution.median, "seeded runs reproduce", failed);

    expect(throwsAs<InvalidParameterException>([&] {
               service.combineMitigations({"homeopathy"}, AdverseEventType::CRS, sleTimeline(), 7ULL, 100);
           }),
           "unknown strategy must throw", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_methods() {
    std::cout << "[T6] list and compare methods\n";
    int failed = 0;
    SafetyRiskService service(EngineConfiguration::defaults());

    expect(service.listMethods().size() == 7, "seven methods listed", failed);

    EstimationRequest req;
    req.observations = sleTimeline();
    const ComparisonResponse all = service.compareMethods(AdverseEventType::CRS, req, {});
    expect(all.entries.size() == 7, "empty selection compares every method", failed);
    expect(contains(all.provenance.approximations, "method_failed:kaplan_meier"),
           "Kaplan-Meier without onset records reported as failed", failed);
    expect(contains(all.provenance.approximations, "method_failed:predictive_posterior"),
           "predictive without a cohort size reported as failed", failed);
    for (const auto& e : all.entries) {
        if (e.method_id == "bayesian_beta_binomial" || e.method_id == "clopper_pearson") {
            expect(e.succeeded, e.method_id + " succeeds", failed);
        }
    }

    const ComparisonResponse two = service.compareMethods(AdverseEventType::CRS, req, {"wilson", "clopper_pearson"});
    expect(two.entries.size() == 2 && two.entries[0].method_id == "wilson", "selection order kept", failed);
    expect(two.provenance.method == "wilson,clopper_pearson", "selection recorded", failed);
    expect(two.provenance.approximations.empty(), "no failures", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_concurrent_estimates() {
    std::cout << "[T7] concurrent estimation\n";
    int failed = 0;
    const auto config = EngineConfiguration::defaults()->withSettings({{"credible_level", 0.9}}, "builtin-90");
    const SafetyRiskService service(config);

    EstimationRequest req;
    req.observations = sleTimeline();
    req.options.credible_level = 0.9;
    const RiskEstimate reference = service.estimateRisk(AdverseEventType::CRS, req, "clopper_pearson").estimate;

    std::vector<RiskEstimateResponse> results(8);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i] { results[i] = service.estimateRisk(AdverseEventType::CRS, req, "clopper_pearson"); });
    }
    for (auto& t : threads) t.join();

    for (const auto& r : results) {
        expect(r.estimate.interval.lower == reference.interval.lower &&
               r.estimate.interval.upper == reference.interval.upper, "identical concurrent results", failed);
        expect(r.provenance.configuration_version == "builtin-90", "derived version recorded", failed);
    }

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

} // namespace

int main() {
    Logger::getInstance().setLogLevel(LogLevel::ERROR);

    int failed = 0;
    failed += test_estimate_risk();
    failed += test_evidence_accrual();
    failed += test_stopping_boundary();
    failed += test_detect_signal();
    failed += test_combine_mitigations();
    failed += test_methods();
    failed += test_concurrent_estimates();

    if (failed == 0) {
        std::cout << "\nAll 7 tests passed.\n";
        return 0;
    }
    std::cout << "\n" << failed << " test(s) FAILED.\n";
    return 1;
}
