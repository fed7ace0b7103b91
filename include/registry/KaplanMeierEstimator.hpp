#ifndef KAPLAN_MEIER_ESTIMATOR_HPP
#define KAPLAN_MEIER_ESTIMATOR_HPP

#include "registry/interfaces/IRiskEstimator.hpp"

#include <optional>
#include <vector>

namespace ctsafety {

struct KaplanMeierStep {
    double time = 0.0;
    int at_risk = 0;
    int events = 0;
    int censored = 0;
    double survival = 1.0;
    double greenwood_sum = 0.0;
};

struct KaplanMeierCurve {
    int subjects = 0;
    int total_events = 0;
    std::vector<KaplanMeierStep> steps;
    std::optional<double> median_time;

    /// Survival just after `t` (step function, right-continuous).
    double survivalAt(double t) const;
};

/**
 * @brief Product-limit estimate of time to onset with right censoring.
 *
 * Records are sorted once; the at-risk count is decremented as each time is passed,
 * so fitting is O(n log n). The reported risk is the cumulative incidence 1 - S(t) at
 * the requested horizon with a log(-log) interval from Greenwood's variance.
 */
class KaplanMeierEstimator : public IRiskEstimator {
public:
    std::string methodId() const override { return "kaplan_meier"; }
    std::string description() const override;
    std::vector<std::string> suitableContexts() const override;
    RiskEstimate estimate(const EstimationRequest& request, AdverseEventType type) const override;

    static KaplanMeierCurve fit(const std::vector<TimeToEventRecord>& records, AdverseEventType type);
};

} // namespace ctsafety

#endif // KAPLAN_MEIER_ESTIMATOR_HPP
