#ifndef ENGINE_CONFIGURATION_HPP
#define ENGINE_CONFIGURATION_HPP

#include "mitigation/MitigationTypes.hpp"
#include "safety/SafetyTypes.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ctsafety {

enum class HeterogeneityPolicy {
    Annotate,
    Reject
};

enum class RecentApprovalPolicy {
    Annotate,
    Suppress
};

struct SignalThresholds {
    double strong_prr = 2.0;
    double strong_eb05 = 2.0;
    double moderate_prr = 2.0;
    double weak_prr = 1.5;
    double weak_eb05 = 1.0;
    long long min_cases = 3;
};

/**
 * @brief Prior and clinical target rate configured for one adverse-event type.
 */
struct AdverseEventProfile {
    PriorSpecification prior;
    double target_rate;
};

/**
 * @brief Immutable, versioned configuration injected into every computation.
 *
 * Holds the per-type priors and target rates, the mitigation catalogue with its
 * correlation matrix, product approval dates and numeric settings. Instances are
 * shared as `std::shared_ptr<const EngineConfiguration>`; any change produces a new
 * object with a new version string so historical estimates can be reproduced exactly.
 *
 * Recognized settings (defaults in parentheses):
 * - "credible_level" (0.95), "stopping_probability_threshold" (0.8)
 * - "monte_carlo_samples" (10000), "projection_horizon" (50)
 * - "rate_limit_requests" (40), "rate_limit_window_seconds" (60)
 * - "cache_ttl_seconds" (86400), "cache_capacity" (4096)
 * - "query_timeout_seconds" (10), "query_max_retries" (3), "query_initial_backoff_seconds" (0.5)
 * - "source_workers" (4)
 * - "recent_approval_window_days" (730), "recent_approval_suppress" (0)
 * - "heterogeneity_reject" (0), "heterogeneity_i2_limit" (0.75)
 * - "signal_confidence_level" (0.95), "mgps_min_pairs" (10)
 * - "mgps_iterations" (300), "mgps_cloud_size" (32), "mgps_seed" (20240101)
 * - signal thresholds: "strong_prr", "strong_eb05", "moderate_prr", "weak_prr", "weak_eb05", "min_cases"
 */
class EngineConfiguration {
public:
    EngineConfiguration(std::string version,
                        std::map<AdverseEventType, AdverseEventProfile> profiles,
                        std::vector<MitigationStrategy> strategies,
                        CorrelationMatrix correlations,
                        std::map<std::string, std::string> approval_dates,
                        std::map<std::string, double> settings);

    const std::string& version() const { return version_; }

    bool hasProfile(AdverseEventType type) const { return profiles_.count(type) > 0; }
    const PriorSpecification& prior(AdverseEventType type) const;
    double targetRate(AdverseEventType type) const;

    const std::vector<MitigationStrategy>& strategies() const { return strategies_; }
    const MitigationStrategy& strategy(const std::string& id) const;
    bool hasStrategy(const std::string& id) const;
    const CorrelationMatrix& correlations() const { return correlations_; }

    std::optional<std::string> approvalDate(const std::string& product) const;
    const std::map<std::string, std::string>& approvalDates() const { return approval_dates_; }

    double setting(const std::string& key, double default_value) const;
    const std::map<std::string, double>& settings() const { return settings_; }

    double credibleLevel() const;
    HeterogeneityPolicy heterogeneityPolicy() const;
    RecentApprovalPolicy recentApprovalPolicy() const;
    SignalThresholds signalThresholds() const;

    /**
     * @brief Derive a new configuration version with some settings replaced.
     */
    std::shared_ptr<const EngineConfiguration> withSettings(const std::map<std::string, double>& overrides,
                                                            const std::string& new_version) const;

    /**
     * @brief Built-in configuration used when no configuration directory is supplied.
     */
    static std::shared_ptr<const EngineConfiguration> defaults();

private:
    std::string version_;
    std::map<AdverseEventType, AdverseEventProfile> profiles_;
    std::vector<MitigationStrategy> strategies_;
    std::map<std::string, std::size_t> strategy_index_;
    CorrelationMatrix correlations_;
    std::map<std::string, std::string> approval_dates_;
    std::map<std::string, double> settings_;
};

} // namespace ctsafety

#endif // ENGINE_CONFIGURATION_HPP
