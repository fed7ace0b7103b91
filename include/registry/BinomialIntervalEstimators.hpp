#ifndef BINOMIAL_INTERVAL_ESTIMATORS_HPP
#define BINOMIAL_INTERVAL_ESTIMATORS_HPP

#include "registry/interfaces/IRiskEstimator.hpp"

namespace ctsafety {

/**
 * @brief Exact (Clopper-Pearson) binomial interval on pooled counts.
 *
 * Guaranteed coverage; the conservative choice for regulatory reporting.
 */
class ClopperPearsonEstimator : public IRiskEstimator {
public:
    std::string methodId() const override { return "clopper_pearson"; }
    std::string description() const override;
    std::vector<std::string> suitableContexts() const override;
    RiskEstimate estimate(const EstimationRequest& request, AdverseEventType type) const override;

    /**
     * @brief Exact interval for x events in n trials. x = 0 gives lower 0, x = n gives upper 1.
     */
    static CredibleInterval interval(int x, int n, double level);
};

/**
 * @brief Wilson score interval, optionally with Newcombe's continuity correction.
 */
class WilsonScoreEstimator : public IRiskEstimator {
public:
    std::string methodId() const override { return "wilson"; }
    std::string description() const override;
    std::vector<std::string> suitableContexts() const override;
    RiskEstimate estimate(const EstimationRequest& request, AdverseEventType type) const override;

    static CredibleInterval interval(int x, int n, double level, bool continuity_correction);
};

} // namespace ctsafety

#endif // BINOMIAL_INTERVAL_ESTIMATORS_HPP
