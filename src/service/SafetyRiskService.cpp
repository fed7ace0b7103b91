#include "service/SafetyRiskService.hpp"
#include "exceptions/Exceptions.hpp"
#include "safety/ObservationPooling.hpp"
#include "utils/Logger.hpp"

#include <sstream>

namespace ctsafety {

static Logger& logger = Logger::getInstance();
static const std::string LOG_SOURCE = "SAFETY_SERVICE";

namespace {

std::string formatNumber(double v) {
    std::ostringstream os;
    os << v;
    return os.str();
}

std::string joined(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += ",";
        out += s;
    }
    return out;
}

void addFlags(Provenance& p, const Diagnostics& d) {
    p.approximations.insert(p.approximations.end(), d.flags.begin(), d.flags.end());
}

} // namespace

SafetyRiskService::SafetyRiskService(std::shared_ptr<const EngineConfiguration> config,
                                     std::shared_ptr<IReportingSource> source)
    : config_(config ? std::move(config) : EngineConfiguration::defaults()),
      registry_(ModelRegistry::createDefault(config_)),
      combiner_(config_)
{
    if (source) {
        client_ = std::make_shared<ReportingSourceClient>(std::move(source),
                                                          ReportingClientOptions::fromConfiguration(*config_));
        detector_ = std::make_unique<SignalDetector>(config_, client_);
    }
    logger.info(LOG_SOURCE, "Service ready with configuration " + config_->version() + ", " +
                std::to_string(registry_.methodIds().size()) + " estimators" +
                (detector_ ? ", reporting source " + client_->sourceName() : ", no reporting source"));
}

Provenance SafetyRiskService::provenance(const std::string& operation, const std::string& method) const {
    Provenance p;
    p.operation = operation;
    p.method = method;
    p.configuration_version = config_->version();
    return p;
}

SignalDetector& SafetyRiskService::detector() {
    if (!detector_) {
        throw ExternalSourceException("SafetyRiskService", "no reporting source configured");
    }
    return *detector_;
}

RiskEstimateResponse SafetyRiskService::estimateRisk(AdverseEventType type,
                                                     const EstimationRequest& request,
                                                     const std::string& method) const {
    RiskEstimateResponse r;
    r.estimate = registry_.estimate(method, request, type);
    r.provenance = provenance("estimate_risk", r.estimate.method_name);
    r.provenance.inputs["adverse_event_type"] = toString(type);
    r.provenance.inputs["observations"] = std::to_string(request.observations.size());
    r.provenance.inputs["onset_records"] = std::to_string(request.onset_records.size());
    r.provenance.inputs["credible_level"] = formatNumber(request.options.credible_level);
    if (request.options.n_new > 0) r.provenance.inputs["n_new"] = std::to_string(request.options.n_new);
    if (request.options.time_horizon) r.provenance.inputs["time_horizon"] = formatNumber(*request.options.time_horizon);
    if (request.options.shrinkage_weight) {
        r.provenance.inputs["shrinkage_weight"] = formatNumber(*request.options.shrinkage_weight);
    }
    addFlags(r.provenance, r.estimate.diagnostics);
    return r;
}

AccrualResponse SafetyRiskService::evidenceAccrual(AdverseEventType type,
                                                   const std::vector<AdverseEventObservation>& observations,
                                                   std::optional<int> projection_horizon) const {
    const std::vector<CumulativeCount> series = cumulativeSeries(observations, type);
    if (series.empty()) {
        THROW_INVALID_PARAM("SafetyRiskService::evidenceAccrual", "no " + toString(type) + " observations");
    }
    const int horizon = projection_horizon.value_or(static_cast<int>(config_->setting("projection_horizon", 50)));

    const BetaBinomialEngine engine(config_->prior(type), config_->credibleLevel());
    AccrualResponse r;
    r.points = engine.evidenceAccrual(series, horizon);
    r.provenance = provenance("evidence_accrual", "bayesian_beta_binomial");
    r.provenance.inputs["adverse_event_type"] = toString(type);
    r.provenance.inputs["timepoints"] = std::to_string(series.size());
    r.provenance.inputs["projection_horizon"] = std::to_string(horizon);
    r.provenance.inputs["prior"] = "Beta(" + formatNumber(engine.prior().alpha()) + ", " +
                                   formatNumber(engine.prior().beta()) + ")";

    bool degraded = false;
    bool projected = false;
    for (const auto& p : r.points) {
        degraded = degraded || p.degraded;
        projected = projected || p.is_projected;
    }
    if (degraded) r.provenance.approximations.push_back("logit_normal_interval");
    if (projected) r.provenance.approximations.push_back("projection_at_posterior_mean");
    return r;
}

StoppingBoundaryResponse SafetyRiskService::stoppingBoundary(AdverseEventType type,
                                                             int max_n,
                                                             std::optional<double> probability_threshold,
                                                             std::optional<double> target_rate) const {
    StoppingBoundaryResponse r;
    r.target_rate = target_rate.value_or(config_->targetRate(type));
    r.probability_threshold = probability_threshold.value_or(config_->setting("stopping_probability_threshold", 0.8));

    const BetaBinomialEngine engine(config_->prior(type), config_->credibleLevel());
    r.boundary = engine.stoppingBoundary(r.target_rate, r.probability_threshold, max_n);
    r.transitions = BetaBinomialEngine::transitionPoints(r.boundary);
    r.provenance = provenance("stopping_boundary", "beta_posterior_exceedance");
    r.provenance.inputs["adverse_event_type"] = toString(type);
    r.provenance.inputs["max_n"] = std::to_string(max_n);
    r.provenance.inputs["target_rate"] = formatNumber(r.target_rate);
    r.provenance.inputs["probability_threshold"] = formatNumber(r.probability_threshold);
    return r;
}

SignalResponse SafetyRiskService::detectSignal(const std::string& drug,
                                               const std::string& event,
                                               const std::string& as_of,
                                               std::optional<ReportingSourceClient::Timeout> timeout) {
    SignalResponse r;
    r.signal = detector().detect(drug, event, as_of, timeout);
    r.provenance = provenance("detect_signal", "prr_ror_mgps");
    r.provenance.inputs["drug"] = drug;
    r.provenance.inputs["event"] = event;
    r.provenance.inputs["as_of"] = as_of;
    r.provenance.inputs["source"] = client_->sourceName();
    addFlags(r.provenance, r.signal.diagnostics);
    return r;
}

std::vector<SignalResponse> SafetyRiskService::detectSignals(const std::vector<std::string>& drugs,
                                                             const std::vector<std::string>& events,
                                                             const std::string& as_of,
                                                             std::optional<ReportingSourceClient::Timeout> timeout) {
    std::vector<SignalResponse> out;
    for (auto& s : detector().detectBatch(drugs, events, as_of, timeout)) {
        SignalResponse r;
        r.provenance = provenance("detect_signal", "prr_ror_mgps");
        r.provenance.inputs["drug"] = s.drug;
        r.provenance.inputs["event"] = s.event;
        r.provenance.inputs["as_of"] = as_of;
        r.provenance.inputs["source"] = client_->sourceName();
        addFlags(r.provenance, s.diagnostics);
        r.signal = std::move(s);
        out.push_back(std::move(r));
    }
    return out;
}

MitigationResponse SafetyRiskService::combineMitigations(const std::vector<std::string>& strategy_ids,
                                                         AdverseEventType target,
                                                         const std::vector<AdverseEventObservation>& observations,
                                                         std::optional<unsigned long long> seed,
                                                         std::optional<int> samples) const {
    MitigationResponse r;
    r.result = combiner_.combine(strategy_ids, target, observations, seed, samples);
    r.provenance = provenance("combine_mitigations", "greedy_pairwise_geometric_interpolation");
    r.provenance.inputs["strategies"] = joined(strategy_ids);
    r.provenance.inputs["target_adverse_event"] = toString(target);
    r.provenance.inputs["observations"] = std::to_string(observations.size());
    r.provenance.inputs["seed"] = std::to_string(r.result.seed);
    r.provenance.inputs["samples"] = std::to_string(r.result.rr_distribution.samples);
    r.provenance.approximations.push_back("monte_carlo");
    addFlags(r.provenance, r.result.diagnostics);
    return r;
}

ComparisonResponse SafetyRiskService::compareMethods(AdverseEventType type,
                                                     const EstimationRequest& request,
                                                     const std::vector<std::string>& method_ids) const {
    ComparisonResponse r;
    r.entries = registry_.compare(method_ids.empty() ? registry_.methodIds() : method_ids, request, type);
    r.provenance = provenance("compare_methods", joined(method_ids.empty() ? registry_.methodIds() : method_ids));
    r.provenance.inputs["adverse_event_type"] = toString(type);
    r.provenance.inputs["observations"] = std::to_string(request.observations.size());
    for (const auto& e : r.entries) {
        if (!e.succeeded) r.provenance.approximations.push_back("method_failed:" + e.method_id);
    }
    return r;
}

} // namespace ctsafety
