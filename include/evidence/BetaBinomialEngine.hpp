#ifndef BETA_BINOMIAL_ENGINE_HPP
#define BETA_BINOMIAL_ENGINE_HPP

#include "safety/ObservationPooling.hpp"
#include "safety/SafetyTypes.hpp"

#include <vector>

namespace ctsafety {

/**
 * @brief Posterior summary at one point of an evidence-accrual sequence.
 *
 * Observed points carry integer cumulative counts. A projected point assumes events accrue
 * at the posterior mean of the last observed point, so its event count may be fractional;
 * it also carries the Beta-Binomial prediction interval for events in the horizon.
 */
struct AccrualPoint {
    Timepoint timepoint;
    double cumulative_events = 0.0;
    int cumulative_n = 0;
    double mean = 0.0;
    CredibleInterval interval;
    IntervalMethod method = IntervalMethod::ExactBetaQuantile;
    bool degraded = false;
    bool is_projected = false;
    int projected_new_patients = 0;
    int predicted_events_low = 0;
    int predicted_events_high = 0;
};

struct StoppingBoundaryPoint {
    int n = 0;
    int max_tolerable_events = -1;  // -1: even zero events crosses the bound
};

/**
 * @brief Beta-Binomial compound distribution for the number of events in a future cohort.
 */
struct PredictiveDistribution {
    int n_new = 0;
    std::vector<double> pmf;
    double mean = 0.0;
    double variance = 0.0;
    double level = 0.95;
    int interval_low = 0;
    int interval_high = 0;

    double probabilityAtLeast(int k) const;
};

/**
 * @brief Conjugate Beta-Binomial inference for a single adverse-event type.
 *
 * All methods are const and re-entrant; the engine holds only the prior and the
 * default credible level.
 */
class BetaBinomialEngine {
public:
    explicit BetaBinomialEngine(PriorSpecification prior, double credible_level = 0.95);

    const PriorSpecification& prior() const { return prior_; }
    double credibleLevel() const { return credible_level_; }

    /**
     * @brief Closed-form posterior Beta(alpha + events, beta + n - events).
     *
     * The interval uses the exact Beta inverse CDF. If that fails numerically, or when
     * `requested` is LogitNormalApproximation, the logit-normal fallback is used and the
     * estimate is marked degraded.
     *
     * @throws InvalidParameterException if events < 0, n <= 0 or events > n.
     */
    PosteriorEstimate posterior(int events, int n) const;
    PosteriorEstimate posterior(int events, int n, IntervalMethod requested) const;

    /// Posterior with real-valued pseudo-counts; used for projections.
    PosteriorEstimate posteriorFromParameters(double alpha_post, double beta_post, IntervalMethod requested) const;

    /**
     * @brief P(p > rate | events, n) under the posterior.
     */
    double exceedanceProbability(int events, int n, double rate) const;

    /**
     * @brief Posterior trajectory over cumulative counts, optionally followed by one projected point.
     *
     * @param series Cumulative counts ordered by timepoint.
     * @param projection_horizon Additional patients to project beyond the last point (0 for none).
     * @throws DataInconsistencyException if cumulative events or n decrease along the series.
     */
    std::vector<AccrualPoint> evidenceAccrual(const std::vector<CumulativeCount>& series,
                                              int projection_horizon) const;

    /**
     * @brief For n = 1..max_n, the largest cumulative event count k with
     *        P(p > target_rate | k, n) < probability_threshold.
     *
     * The result is monotone non-decreasing in n.
     */
    std::vector<StoppingBoundaryPoint> stoppingBoundary(double target_rate,
                                                        double probability_threshold,
                                                        int max_n) const;

    /**
     * @brief Keep only the sample sizes at which the boundary changes (plus the first point).
     */
    static std::vector<StoppingBoundaryPoint> transitionPoints(const std::vector<StoppingBoundaryPoint>& boundary);

    /**
     * @brief Predictive PMF over events in `n_new` future patients given current counts.
     */
    PredictiveDistribution predictive(int events, int n, int n_new) const;

    /// Exact equal-tailed Beta interval. @throws NumericalException when the quantile fails.
    static CredibleInterval exactBetaInterval(double a, double b, double level);

    /// Logit-normal approximation using the exact mean and variance of logit(p) under Beta(a, b).
    static CredibleInterval logitNormalInterval(double a, double b, double level);

private:
    static void validateCounts(int events, int n, const std::string& where);

    PriorSpecification prior_;
    double credible_level_;
};

} // namespace ctsafety

#endif // BETA_BINOMIAL_ENGINE_HPP
