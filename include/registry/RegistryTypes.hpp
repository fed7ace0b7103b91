#ifndef REGISTRY_TYPES_HPP
#define REGISTRY_TYPES_HPP

#include "safety/SafetyTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ctsafety {

struct EstimationOptions {
    double credible_level = 0.95;
    /// Future cohort size for the predictive estimator.
    int n_new = 0;
    /// Kaplan-Meier evaluation time; defaults to the last observed time.
    std::optional<double> time_horizon;
    /// Manual empirical-Bayes weight on the grand mean, in [0, 1].
    std::optional<double> shrinkage_weight;
    bool continuity_correction = false;
};

/**
 * @brief Inputs shared by every estimator. Each estimator filters observations by the
 *        explicit adverse-event type it is asked for.
 */
struct EstimationRequest {
    std::vector<AdverseEventObservation> observations;
    std::vector<TimeToEventRecord> onset_records;
    EstimationOptions options;
};

struct RiskEstimate {
    double point = 0.0;
    CredibleInterval interval;
    std::string method_name;
    Diagnostics diagnostics;
    /// Full distribution where the method produces one (predictive PMF); empty otherwise.
    std::vector<double> distribution;
};

struct MethodDescription {
    std::string id;
    std::string description;
    std::vector<std::string> suitable_contexts;
};

/**
 * @brief One entry of a side-by-side comparison; failed methods keep their error text.
 */
struct MethodComparisonEntry {
    std::string method_id;
    bool succeeded = false;
    RiskEstimate estimate;
    std::string error;
};

} // namespace ctsafety

#endif // REGISTRY_TYPES_HPP
