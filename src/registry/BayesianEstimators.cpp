#include "registry/BayesianEstimators.hpp"
#include "evidence/BetaBinomialEngine.hpp"
#include "exceptions/Exceptions.hpp"
#include "safety/ObservationPooling.hpp"

namespace ctsafety {

namespace {

void recordPrior(Diagnostics& diag, const PriorSpecification& prior) {
    diag.values["prior_alpha"] = prior.alpha();
    diag.values["prior_beta"] = prior.beta();
    diag.note("prior: " + prior.provenance());
}

} // namespace

BayesianBetaBinomialEstimator::BayesianBetaBinomialEstimator(std::shared_ptr<const EngineConfiguration> config)
    : config_(std::move(config))
{
    if (!config_) THROW_INVALID_PARAM("BayesianBetaBinomialEstimator", "configuration must not be null");
}

std::string BayesianBetaBinomialEstimator::description() const {
    return "Conjugate Beta-Binomial posterior mean and exact credible interval";
}

std::vector<std::string> BayesianBetaBinomialEstimator::suitableContexts() const {
    return {"early-phase trials with informative priors", "sequential monitoring", "zero-event cohorts"};
}

RiskEstimate BayesianBetaBinomialEstimator::estimate(const EstimationRequest& request, AdverseEventType type) const {
    const PooledCounts pooled = pooledCountsForType(request.observations, type, "BayesianBetaBinomialEstimator::estimate");
    const BetaBinomialEngine engine(config_->prior(type), request.options.credible_level);
    const PosteriorEstimate post = engine.posterior(pooled.events, pooled.n);

    RiskEstimate result;
    result.method_name = methodId();
    result.point = post.mean;
    result.interval = post.interval;

    Diagnostics& diag = result.diagnostics;
    recordPrior(diag, engine.prior());
    diag.values["alpha_post"] = post.alpha_post;
    diag.values["beta_post"] = post.beta_post;
    diag.values["events"] = pooled.events;
    diag.values["n"] = pooled.n;
    diag.note("interval method: " + toString(post.method));
    if (post.degraded) diag.flag("logit_normal_fallback");
    return result;
}

PredictivePosteriorEstimator::PredictivePosteriorEstimator(std::shared_ptr<const EngineConfiguration> config)
    : config_(std::move(config))
{
    if (!config_) THROW_INVALID_PARAM("PredictivePosteriorEstimator", "configuration must not be null");
}

std::string PredictivePosteriorEstimator::description() const {
    return "Beta-Binomial predictive distribution of event counts in a future cohort";
}

std::vector<std::string> PredictivePosteriorEstimator::suitableContexts() const {
    return {"next-cohort planning", "expected event counts", "probability of at least one event"};
}

RiskEstimate PredictivePosteriorEstimator::estimate(const EstimationRequest& request, AdverseEventType type) const {
    const std::string where = "PredictivePosteriorEstimator::estimate";
    if (request.options.n_new < 1) {
        THROW_INVALID_PARAM(where, "future cohort size (n_new) must be at least 1");
    }
    const PooledCounts pooled = pooledCountsForType(request.observations, type, where);
    const BetaBinomialEngine engine(config_->prior(type), request.options.credible_level);
    const PredictiveDistribution pred = engine.predictive(pooled.events, pooled.n, request.options.n_new);

    RiskEstimate result;
    result.method_name = methodId();
    result.point = pred.mean;
    result.interval = CredibleInterval{static_cast<double>(pred.interval_low),
                                       static_cast<double>(pred.interval_high), pred.level};
    result.distribution = pred.pmf;

    Diagnostics& diag = result.diagnostics;
    recordPrior(diag, engine.prior());
    diag.values["n_new"] = pred.n_new;
    diag.values["variance"] = pred.variance;
    diag.values["p_zero_events"] = pred.pmf.front();
    diag.values["p_at_least_one"] = pred.probabilityAtLeast(1);
    diag.values["events"] = pooled.events;
    diag.values["n"] = pooled.n;
    diag.note("point and interval are event counts in the future cohort");
    return result;
}

} // namespace ctsafety
