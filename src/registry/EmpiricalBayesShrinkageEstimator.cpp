#include "registry/EmpiricalBayesShrinkageEstimator.hpp"
#include "evidence/BetaBinomialEngine.hpp"
#include "exceptions/Exceptions.hpp"
#include "safety/ObservationPooling.hpp"
#include "utils/Logger.hpp"

#include <cmath>

namespace ctsafety {

static Logger& logger = Logger::getInstance();
static const std::string LOG_SOURCE = "EMPIRICAL_BAYES";

namespace {

struct TypeCounts {
    AdverseEventType type;
    int events;
    int n;
};

CredibleInterval betaIntervalWithFallback(double a, double b, double level, Diagnostics& diag) {
    try {
        return BetaBinomialEngine::exactBetaInterval(a, b, level);
    } catch (const NumericalException& e) {
        logger.warning(LOG_SOURCE, std::string("Degraded precision: ") + e.what());
        diag.flag("logit_normal_fallback");
        return BetaBinomialEngine::logitNormalInterval(a, b, level);
    }
}

} // namespace

std::string EmpiricalBayesShrinkageEstimator::description() const {
    return "Empirical-Bayes shrinkage of one adverse-event rate toward the across-type grand mean";
}

std::vector<std::string> EmpiricalBayesShrinkageEstimator::suitableContexts() const {
    return {"sparse per-type data", "borrowing strength across adverse events", "sensitivity analysis via manual weight"};
}

RiskEstimate EmpiricalBayesShrinkageEstimator::estimate(const EstimationRequest& request, AdverseEventType type) const {
    const std::string where = "EmpiricalBayesShrinkageEstimator::estimate";
    const double level = request.options.credible_level;

    std::vector<TypeCounts> groups;
    const TypeCounts* target = nullptr;
    for (AdverseEventType t : allAdverseEventTypes()) {
        const PooledCounts pooled = poolCounts(latestCountsPerStudy(request.observations, t));
        if (pooled.studies == 0) continue;
        groups.push_back(TypeCounts{t, pooled.events, pooled.n});
    }
    for (const auto& g : groups) {
        if (g.type == type) target = &g;
    }
    if (target == nullptr) {
        THROW_INVALID_PARAM(where, "no observations for adverse event type " + toString(type));
    }

    double total_events = 0.0;
    double total_n = 0.0;
    for (const auto& g : groups) {
        total_events += g.events;
        total_n += g.n;
    }
    const double grand_mean = total_events / total_n;
    const double own_rate = static_cast<double>(target->events) / target->n;
    const int k = static_cast<int>(groups.size());

    RiskEstimate result;
    result.method_name = methodId();
    Diagnostics& diag = result.diagnostics;
    diag.values["grand_mean"] = grand_mean;
    diag.values["own_rate"] = own_rate;
    diag.values["types_used"] = k;
    diag.values["events"] = target->events;
    diag.values["n"] = target->n;

    double tau2 = 0.0;
    if (k >= 2) {
        double var_obs = 0.0;
        double mean_v = 0.0;
        for (const auto& g : groups) {
            const double p = static_cast<double>(g.events) / g.n;
            var_obs += (p - grand_mean) * (p - grand_mean);
            mean_v += grand_mean * (1.0 - grand_mean) / g.n;
        }
        var_obs /= (k - 1);
        mean_v /= k;
        tau2 = std::max(0.0, var_obs - mean_v);
        diag.values["tau2"] = tau2;
    }

    double weight = 1.0;
    if (request.options.shrinkage_weight.has_value()) {
        weight = *request.options.shrinkage_weight;
        if (!(weight >= 0.0 && weight <= 1.0)) {
            THROW_INVALID_PARAM(where, "shrinkage weight override must lie in [0, 1]");
        }
        diag.flag("shrinkage_weight_override");
        logger.info(LOG_SOURCE, "Using manual shrinkage weight " + std::to_string(weight) + " for " + toString(type));
    } else {
        if (k < 2) {
            THROW_INVALID_PARAM(where,
                "estimating the shrinkage weight requires observations for at least two adverse event types");
        }
        const double v = grand_mean * (1.0 - grand_mean) / target->n;
        weight = (v <= 0.0 || tau2 <= 0.0) ? 1.0 : v / (v + tau2);
    }
    diag.values["shrinkage_weight"] = weight;

    result.point = weight * grand_mean + (1.0 - weight) * own_rate;

    if (weight >= 1.0 || grand_mean <= 0.0 || grand_mean >= 1.0) {
        diag.flag("full_shrinkage_pooled_interval");
        result.interval = betaIntervalWithFallback(total_events + 0.5, total_n - total_events + 0.5, level, diag);
    } else if (weight <= 0.0) {
        diag.flag("no_shrinkage_jeffreys_interval");
        result.interval = betaIntervalWithFallback(target->events + 0.5, target->n - target->events + 0.5, level, diag);
    } else {
        const double m = target->n * weight / (1.0 - weight);
        diag.values["prior_strength"] = m;
        result.interval = betaIntervalWithFallback(m * grand_mean + target->events,
                                                   m * (1.0 - grand_mean) + (target->n - target->events),
                                                   level, diag);
    }
    return result;
}

} // namespace ctsafety
