#ifndef EMPIRICAL_BAYES_SHRINKAGE_ESTIMATOR_HPP
#define EMPIRICAL_BAYES_SHRINKAGE_ESTIMATOR_HPP

#include "registry/interfaces/IRiskEstimator.hpp"

namespace ctsafety {

/**
 * @brief Shrinks one adverse-event type's rate toward the grand mean across all types present.
 *
 * The between-type variance tau^2 is a method-of-moments estimate; the weight on the grand
 * mean is B = v / (v + tau^2) with v the binomial sampling variance at the grand mean.
 * `EstimationOptions::shrinkage_weight` replaces B when set. The interval comes from the
 * implied Beta posterior Beta(M*pbar + x, M*(1 - pbar) + n - x) with M = n*B / (1 - B),
 * whose mean equals B*pbar + (1 - B)*x/n.
 */
class EmpiricalBayesShrinkageEstimator : public IRiskEstimator {
public:
    std::string methodId() const override { return "empirical_bayes"; }
    std::string description() const override;
    std::vector<std::string> suitableContexts() const override;
    RiskEstimate estimate(const EstimationRequest& request, AdverseEventType type) const override;
};

} // namespace ctsafety

#endif // EMPIRICAL_BAYES_SHRINKAGE_ESTIMATOR_HPP
