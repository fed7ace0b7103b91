#ifndef SAFETY_RISK_SERVICE_HPP
#define SAFETY_RISK_SERVICE_HPP

#include "evidence/BetaBinomialEngine.hpp"
#include "mitigation/MitigationCombiner.hpp"
#include "registry/ModelRegistry.hpp"
#include "safety/EngineConfiguration.hpp"
#include "signal/ReportingSourceClient.hpp"
#include "signal/SignalDetector.hpp"
#include "signal/interfaces/IReportingSource.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ctsafety {

/**
 * @brief What produced a response: operation, method, configuration version, the inputs
 *        consumed and every approximation or fallback taken on the way.
 */
struct Provenance {
    std::string operation;
    std::string method;
    std::string configuration_version;
    std::map<std::string, std::string> inputs;
    std::vector<std::string> approximations;
};

struct RiskEstimateResponse {
    RiskEstimate estimate;
    Provenance provenance;
};

struct AccrualResponse {
    std::vector<AccrualPoint> points;
    Provenance provenance;
};

struct StoppingBoundaryResponse {
    double target_rate = 0.0;
    double probability_threshold = 0.0;
    std::vector<StoppingBoundaryPoint> boundary;
    std::vector<StoppingBoundaryPoint> transitions;
    Provenance provenance;
};

struct SignalResponse {
    SignalResult signal;
    Provenance provenance;
};

struct MitigationResponse {
    MitigationResult result;
    Provenance provenance;
};

struct ComparisonResponse {
    std::vector<MethodComparisonEntry> entries;
    Provenance provenance;
};

/**
 * @brief Entry point for the orchestration layer.
 *
 * Binds one immutable configuration version to the evidence engine, the model registry,
 * the signal detector and the mitigation combiner. Everything except signal detection is
 * a pure function of its arguments and may be called concurrently. Signal detection
 * requires a reporting source; its rate limiter and cache are shared by all callers.
 */
class SafetyRiskService {
public:
    /**
     * @param config Configuration version used for every call.
     * @param source External report database; may be null when signals are not needed.
     */
    explicit SafetyRiskService(std::shared_ptr<const EngineConfiguration> config,
                               std::shared_ptr<IReportingSource> source = nullptr);

    const EngineConfiguration& configuration() const { return *config_; }
    const ModelRegistry& registry() const { return registry_; }
    bool hasReportingSource() const { return detector_ != nullptr; }

    RiskEstimateResponse estimateRisk(AdverseEventType type,
                                      const EstimationRequest& request,
                                      const std::string& method) const;

    /// @param projection_horizon Defaults to the "projection_horizon" setting.
    AccrualResponse evidenceAccrual(AdverseEventType type,
                                    const std::vector<AdverseEventObservation>& observations,
                                    std::optional<int> projection_horizon = std::nullopt) const;

    /**
     * @param probability_threshold Defaults to the "stopping_probability_threshold" setting.
     * @param target_rate           Defaults to the configured target rate of the type.
     */
    StoppingBoundaryResponse stoppingBoundary(AdverseEventType type,
                                              int max_n,
                                              std::optional<double> probability_threshold = std::nullopt,
                                              std::optional<double> target_rate = std::nullopt) const;

    /// @throws ExternalSourceException if no reporting source is configured.
    SignalResponse detectSignal(const std::string& drug,
                                const std::string& event,
                                const std::string& as_of,
                                std::optional<ReportingSourceClient::Timeout> timeout = std::nullopt);

    std::vector<SignalResponse> detectSignals(const std::vector<std::string>& drugs,
                                              const std::vector<std::string>& events,
                                              const std::string& as_of,
                                              std::optional<ReportingSourceClient::Timeout> timeout = std::nullopt);

    MitigationResponse combineMitigations(const std::vector<std::string>& strategy_ids,
                                          AdverseEventType target,
                                          const std::vector<AdverseEventObservation>& observations,
                                          std::optional<unsigned long long> seed = std::nullopt,
                                          std::optional<int> samples = std::nullopt) const;

    std::vector<MethodDescription> listMethods() const { return registry_.listMethods(); }

    ComparisonResponse compareMethods(AdverseEventType type,
                                      const EstimationRequest& request,
                                      const std::vector<std::string>& method_ids) const;

private:
    Provenance provenance(const std::string& operation, const std::string& method) const;
    SignalDetector& detector();

    std::shared_ptr<const EngineConfiguration> config_;
    ModelRegistry registry_;
    MitigationCombiner combiner_;
    std::shared_ptr<ReportingSourceClient> client_;
    std::unique_ptr<SignalDetector> detector_;
};

} // namespace ctsafety

#endif // SAFETY_RISK_SERVICE_HPP
