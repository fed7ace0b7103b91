#ifndef GAMMA_POISSON_SHRINKER_HPP
#define GAMMA_POISSON_SHRINKER_HPP

#include "optimizers/interfaces/IObjectiveFunction.hpp"
#include "signal/SignalTypes.hpp"

#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace ctsafety {

/**
 * @brief Two-component Gamma mixture prior on the reporting ratio lambda:
 *        p * Gamma(alpha1, beta1) + (1 - p) * Gamma(alpha2, beta2), rate parameterization.
 */
struct MixturePrior {
    double alpha1 = 0.2;
    double beta1 = 0.1;
    double alpha2 = 2.0;
    double beta2 = 4.0;
    double p = 1.0 / 3.0;

    /// DuMouchel (1999) starting values.
    static MixturePrior dumouchelDefault() { return MixturePrior{}; }

    void validate() const;
};

/**
 * @brief Observed count n and expected count E = drug_total * event_total / N.
 */
struct PairObservation {
    long long observed = 0;
    double expected = 0.0;
};

struct MgpsFit {
    MixturePrior prior;
    double log_likelihood = 0.0;
    int pairs = 0;
    int iterations = 0;
    bool used_default = false;
    std::string reason;
};

struct EbgmResult {
    double ebgm = 0.0;
    double eb05 = 0.0;
    double eb95 = 0.0;
    double posterior_weight1 = 0.0;  // posterior probability of the first component
    double expected = 0.0;
    long long observed = 0;
};

/**
 * @brief Log marginal likelihood of all pairs under a mixture prior, over the unconstrained
 *        parameters (ln a1, ln b1, ln a2, ln b2, logit p). Used to fit the prior by maximum
 *        likelihood; evaluation is const and thread-safe.
 */
class MgpsObjectiveFunction : public IObjectiveFunction {
public:
    explicit MgpsObjectiveFunction(std::vector<PairObservation> pairs);

    double calculate(const Eigen::VectorXd& parameters) const override;
    const std::vector<std::string>& getParameterNames() const override { return names_; }

    static Eigen::VectorXd toUnconstrained(const MixturePrior& prior);
    static MixturePrior fromUnconstrained(const Eigen::VectorXd& theta);

private:
    std::vector<PairObservation> pairs_;
    std::vector<std::string> names_;
};

/**
 * @brief Multi-item Gamma-Poisson Shrinker (MGPS) posterior for a drug-event pair.
 *
 * Given n ~ Poisson(lambda * E) and the mixture prior, the posterior is a mixture of
 * Gamma(alpha_k + n, beta_k + E) with weights from the negative-binomial marginals,
 * combined in log space. EBGM = exp(E[ln lambda]). EB05 and EB95 are percentiles of the
 * posterior mixture found by bracketed root finding on its CDF.
 */
class GammaPoissonShrinker {
public:
    explicit GammaPoissonShrinker(MixturePrior prior);

    const MixturePrior& prior() const { return prior_; }

    /// @throws InvalidParameterException if observed < 0 or expected <= 0.
    EbgmResult evaluate(long long observed, double expected) const;

    /// Log of the negative-binomial marginal probability of n for one Gamma component.
    static double logNegativeBinomial(long long n, double expected, double alpha, double beta);

    /// Log marginal probability of n under the full mixture.
    static double logMarginal(long long n, double expected, const MixturePrior& prior);

    /**
     * @brief Quantile of a two-component Gamma mixture (rate parameterization).
     *
     * The root is bracketed by the component quantiles: at the smaller one the mixture
     * CDF is at most `prob`, at the larger one at least `prob`.
     */
    static double mixtureQuantile(double prob, double w1, double shape1, double rate1, double shape2, double rate2);

    static double mixtureCdf(double x, double w1, double shape1, double rate1, double shape2, double rate2);

    /**
     * @brief Fit the prior by maximum marginal likelihood over all pairs.
     *
     * Falls back to the DuMouchel default (flagged via `used_default`) when fewer than
     * `min_pairs` usable pairs exist.
     *
     * @param optimizer_settings Passed to HillClimbingOptimizer::configure.
     */
    static MgpsFit fit(const std::vector<PairObservation>& pairs,
                       const std::map<std::string, double>& optimizer_settings,
                       int min_pairs);

private:
    MixturePrior prior_;
};

} // namespace ctsafety

#endif // GAMMA_POISSON_SHRINKER_HPP
