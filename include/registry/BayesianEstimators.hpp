#ifndef BAYESIAN_ESTIMATORS_HPP
#define BAYESIAN_ESTIMATORS_HPP

#include "registry/interfaces/IRiskEstimator.hpp"
#include "safety/EngineConfiguration.hpp"

#include <memory>

namespace ctsafety {

/**
 * @brief Conjugate Beta-Binomial posterior with the configured prior for the type.
 */
class BayesianBetaBinomialEstimator : public IRiskEstimator {
public:
    explicit BayesianBetaBinomialEstimator(std::shared_ptr<const EngineConfiguration> config);

    std::string methodId() const override { return "bayesian_beta_binomial"; }
    std::string description() const override;
    std::vector<std::string> suitableContexts() const override;
    RiskEstimate estimate(const EstimationRequest& request, AdverseEventType type) const override;

private:
    std::shared_ptr<const EngineConfiguration> config_;
};

/**
 * @brief Expected number of events in a future cohort of `options.n_new` patients.
 *
 * The point is the predictive mean count, the interval is the equal-tailed prediction
 * interval in counts, and `distribution` holds the full Beta-Binomial PMF.
 */
class PredictivePosteriorEstimator : public IRiskEstimator {
public:
    explicit PredictivePosteriorEstimator(std::shared_ptr<const EngineConfiguration> config);

    std::string methodId() const override { return "predictive_posterior"; }
    std::string description() const override;
    std::vector<std::string> suitableContexts() const override;
    RiskEstimate estimate(const EstimationRequest& request, AdverseEventType type) const override;

private:
    std::shared_ptr<const EngineConfiguration> config_;
};

} // namespace ctsafety

#endif // BAYESIAN_ESTIMATORS_HPP
