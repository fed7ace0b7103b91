// tests/test_evidence_engine.cpp
//
//   T1: Conjugate update for the CRS prior with zero events in 47 patients
//   T2: Zero-event upper bound shrinks as n grows
//   T3: Input validation (events > n, n = 0, invalid prior)
//   T4: Evidence accrual: width monotone at fixed events, labelled projection,
//       decreasing cumulative counts rejected
//   T5: Stopping boundary is monotone and tight for several target rates
//   T6: Predictive PMF is a proper distribution with the Beta-Binomial mean
//   T7: Logit-normal fallback stays inside (0, 1) and is marked degraded
//   T8: Closed-form paths are bit-for-bit repeatable

#include "evidence/BetaBinomialEngine.hpp"
#include "exceptions/Exceptions.hpp"
#include "safety/ObservationPooling.hpp"
#include "utils/Logger.hpp"

#include <cmath>
#include <iostream>
#include <numeric>
#include <string>
#include <vector>

using namespace ctsafety;

namespace {

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

PriorSpecification crsPrior() {
    return PriorSpecification(0.21, 1.29, "Discounted oncology ~14%");
}

int test_crs_zero_event_scenario() {
    std::cout << "[T1] posterior Beta(0.21, 48.29) after 0/47\n";
    int failed = 0;
    const BetaBinomialEngine engine(crsPrior());
    const PosteriorEstimate post = engine.posterior(0, 47);

    expect(std::abs(post.alpha_post - 0.21) < 1e-12, "alpha_post should be 0.21", failed);
    expect(std::abs(post.beta_post - 48.29) < 1e-12, "beta_post should be 48.29", failed);
    expect(std::abs(post.mean - 0.21 / 48.5) < 1e-12, "mean should be 0.21/48.5", failed);
    expect(std::abs(post.mean - 0.0043) < 1e-4, "mean should be about 0.43%", failed);
    expect(post.mean < crsPrior().mean(), "zero events must pull the mean below the prior mean", failed);
    expect(post.method == IntervalMethod::ExactBetaQuantile && !post.degraded, "exact interval expected", failed);
    expect(post.interval.lower >= 0.0 && post.interval.lower < post.mean, "lower bound below mean", failed);
    expect(post.interval.upper > post.mean && post.interval.upper < 0.1, "upper bound plausible", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_zero_event_upper_bound_monotone() {
    std::cout << "[T2] zero-event upper bound non-increasing in n\n";
    int failed = 0;
    const BetaBinomialEngine engine(crsPrior());
    double previous = 1.0;
    for (int n = 1; n <= 200; ++n) {
        const PosteriorEstimate post = engine.posterior(0, n);
        expect(post.interval.upper <= previous + 1e-15, "upper bound grew at n=" + std::to_string(n), failed);
        expect(post.mean < crsPrior().mean(), "mean not below prior at n=" + std::to_string(n), failed);
        previous = post.interval.upper;
    }
    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_input_validation() {
    std::cout << "[T3] invalid inputs are rejected\n";
    int failed = 0;
    const BetaBinomialEngine engine(crsPrior());

    auto throwsInvalid = [](auto fn) {
        try {
            fn();
        } catch (const InvalidParameterException&) {
            return true;
        }
        return false;
    };

    expect(throwsInvalid([&] { engine.posterior(5, 4); }), "events > n must throw", failed);
    expect(throwsInvalid([&] { engine.posterior(0, 0); }), "n = 0 must throw", failed);
    expect(throwsInvalid([&] { engine.posterior(-1, 10); }), "negative events must throw", failed);
    expect(throwsInvalid([] { PriorSpecification(0.0, 1.0, "bad"); }), "alpha = 0 must throw", failed);
    expect(throwsInvalid([] { PriorSpecification(1.0, -2.0, "bad"); }), "negative beta must throw", failed);
    expect(throwsInvalid([] { AdverseEventObservation(AdverseEventType::CRS, 3, 2, "S", Timepoint{1, "t1"}); }),
           "observation with events > n must throw", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_evidence_accrual() {
    std::cout << "[T4] evidence accrual\n";
    int failed = 0;
    const BetaBinomialEngine engine(crsPrior());

    std::vector<CumulativeCount> zero_series = {
        {Timepoint{1, "2022 Q3"}, 0, 5},
        {Timepoint{2, "2023 Q4"}, 0, 20},
        {Timepoint{3, "2024 Q2"}, 0, 37},
        {Timepoint{4, "2025 Q1"}, 0, 47},
    };
    const auto points = engine.evidenceAccrual(zero_series, 0);
    expect(points.size() == 4, "one point per timepoint without projection", failed);
    for (std::size_t i = 1; i < points.size(); ++i) {
        expect(points[i].interval.width() <= points[i - 1].interval.width() + 1e-15,
               "width grew at point " + std::to_string(i), failed);
    }

    std::vector<AdverseEventObservation> obs = {
        {AdverseEventType::CRS, 0, 5, "SLE", Timepoint{1, "2022 Q3"}},
        {AdverseEventType::CRS, 0, 20, "SLE", Timepoint{2, "2023 Q4"}},
        {AdverseEventType::CRS, 1, 37, "SLE", Timepoint{3, "2024 Q2"}},
        {AdverseEventType::CRS, 1, 47, "SLE", Timepoint{4, "2025 Q1"}},
        {AdverseEventType::ICANS, 0, 47, "SLE", Timepoint{4, "2025 Q1"}},
    };
    const auto series = cumulativeSeries(obs, AdverseEventType::CRS);
    expect(series.size() == 4, "CRS series has four timepoints", failed);
    const auto projected = engine.evidenceAccrual(series, 50);
    expect(projected.size() == 5, "projection appended", failed);
    if (projected.size() == 5) {
        const AccrualPoint& last = projected.back();
        expect(last.is_projected, "last point flagged as projected", failed);
        expect(!projected[3].is_projected, "observed points not flagged", failed);
        expect(last.cumulative_n == 97, "projection adds 50 patients to 47", failed);
        expect(last.timepoint.label.find("projection") != std::string::npos, "projection labelled", failed);
        expect(last.predicted_events_low <= last.predicted_events_high, "prediction interval ordered", failed);
        expect(std::abs(projected[3].mean - (0.21 + 1) / (1.5 + 47)) < 1e-12,
               "last observed mean uses CRS counts 1/47", failed);
    }

    std::vector<CumulativeCount> broken = {
        {Timepoint{1, "a"}, 2, 10},
        {Timepoint{2, "b"}, 1, 20},
    };
    bool threw = false;
    try {
        engine.evidenceAccrual(broken, 0);
    } catch (const DataInconsistencyException&) {
        threw = true;
    }
    expect(threw, "decreasing cumulative events must throw DataInconsistencyException", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_stopping_boundary() {
    std::cout << "[T5] stopping boundary\n";
    int failed = 0;
    const BetaBinomialEngine engine(crsPrior());

    const std::vector<std::pair<double, double>> cases = {{0.05, 0.8}, {0.10, 0.95}, {0.01, 0.8}};
    for (const auto& [rate, threshold] : cases) {
        const auto boundary = engine.stoppingBoundary(rate, threshold, 100);
        expect(boundary.size() == 100, "one point per n", failed);
        for (std::size_t i = 0; i < boundary.size(); ++i) {
            const auto& p = boundary[i];
            if (i > 0) {
                expect(p.max_tolerable_events >= boundary[i - 1].max_tolerable_events,
                       "boundary decreased at n=" + std::to_string(p.n), failed);
            }
            if (p.max_tolerable_events >= 0) {
                expect(engine.exceedanceProbability(p.max_tolerable_events, p.n, rate) < threshold,
                       "boundary point crosses the threshold at n=" + std::to_string(p.n), failed);
            }
            if (p.max_tolerable_events + 1 <= p.n) {
                expect(engine.exceedanceProbability(p.max_tolerable_events + 1, p.n, rate) >= threshold,
                       "boundary not tight at n=" + std::to_string(p.n), failed);
            }
        }
        const auto transitions = BetaBinomialEngine::transitionPoints(boundary);
        expect(!transitions.empty() && transitions.front().n == 1, "transitions start at n=1", failed);
    }

    for (double bad : {0.0, 1.0, -0.1, 1.5}) {
        bool threw = false;
        try {
            engine.stoppingBoundary(bad, 0.8, 10);
        } catch (const InvalidParameterException&) {
            threw = true;
        }
        expect(threw, "target rate " + std::to_string(bad) + " must be rejected", failed);
    }

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_predictive_distribution() {
    std::cout << "[T6] predictive posterior PMF\n";
    int failed = 0;
    const BetaBinomialEngine engine(crsPrior());
    const PredictiveDistribution pred = engine.predictive(1, 47, 30);

    expect(pred.pmf.size() == 31, "PMF covers 0..n_new", failed);
    const double total = std::accumulate(pred.pmf.begin(), pred.pmf.end(), 0.0);
    expect(std::abs(total - 1.0) < 1e-10, "PMF sums to one", failed);
    const double p = (0.21 + 1) / (1.5 + 47);
    expect(std::abs(pred.mean - 30 * p) < 1e-9, "mean equals n_new * posterior mean", failed);
    expect(std::abs(pred.probabilityAtLeast(0) - 1.0) < 1e-10, "P(X >= 0) = 1", failed);
    expect(std::abs(pred.probabilityAtLeast(1) - (1.0 - pred.pmf[0])) < 1e-12, "P(X >= 1) = 1 - P(0)", failed);
    expect(pred.interval_low <= pred.interval_high, "interval ordered", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_logit_normal_fallback() {
    std::cout << "[T7] logit-normal fallback\n";
    int failed = 0;
    const BetaBinomialEngine engine(crsPrior());
    const PosteriorEstimate post = engine.posterior(0, 47, IntervalMethod::LogitNormalApproximation);

    expect(post.degraded, "fallback must be marked degraded", failed);
    expect(post.method == IntervalMethod::LogitNormalApproximation, "method recorded", failed);
    expect(post.interval.lower > 0.0, "no clipping at zero needed", failed);
    expect(post.interval.upper < 1.0, "upper inside support", failed);
    expect(post.interval.lower < post.interval.upper, "interval ordered", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_repeatability() {
    std::cout << "[T8] repeatability\n";
    int failed = 0;
    const BetaBinomialEngine engine(crsPrior());
    const PosteriorEstimate a = engine.posterior(3, 40);
    const PosteriorEstimate b = engine.posterior(3, 40);
    expect(a.mean == b.mean && a.interval.lower == b.interval.lower && a.interval.upper == b.interval.upper,
           "identical inputs must give identical outputs", failed);
    if (!failed) std::cout << "  PASS\n";
    return failed;
}

} // namespace

int main() {
    Logger::getInstance().setLogLevel(LogLevel::ERROR);
    int total = 0;
    total += test_crs_zero_event_scenario();
    total += test_zero_event_upper_bound_monotone();
    total += test_input_validation();
    total += test_evidence_accrual();
    total += test_stopping_boundary();
    total += test_predictive_distribution();
    total += test_logit_normal_fallback();
    total += test_repeatability();

    if (total == 0) {
        std::cout << "\nAll evidence engine tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
