#include "registry/ModelRegistry.hpp"
#include "exceptions/Exceptions.hpp"
#include "registry/BayesianEstimators.hpp"
#include "registry/BinomialIntervalEstimators.hpp"
#include "registry/EmpiricalBayesShrinkageEstimator.hpp"
#include "registry/KaplanMeierEstimator.hpp"
#include "registry/RandomEffectsMetaAnalysis.hpp"
#include "utils/Logger.hpp"

namespace ctsafety {

static Logger& logger = Logger::getInstance();
static const std::string LOG_SOURCE = "MODEL_REGISTRY";

void ModelRegistry::registerEstimator(std::shared_ptr<const IRiskEstimator> estimator) {
    if (!estimator) {
        THROW_INVALID_PARAM("ModelRegistry::registerEstimator", "estimator must not be null");
    }
    const std::string id = estimator->methodId();
    if (!estimators_.emplace(id, std::move(estimator)).second) {
        THROW_INVALID_PARAM("ModelRegistry::registerEstimator", "method '" + id + "' is already registered");
    }
    order_.push_back(id);
    logger.debug(LOG_SOURCE, "Registered estimator " + id);
}

bool ModelRegistry::contains(const std::string& method_id) const {
    return estimators_.count(method_id) > 0;
}

const IRiskEstimator& ModelRegistry::get(const std::string& method_id) const {
    auto it = estimators_.find(method_id);
    if (it == estimators_.end()) {
        THROW_INVALID_PARAM("ModelRegistry::get", "unknown estimation method '" + method_id + "'");
    }
    return *it->second;
}

std::vector<std::string> ModelRegistry::methodIds() const {
    return order_;
}

std::vector<MethodDescription> ModelRegistry::listMethods() const {
    std::vector<MethodDescription> out;
    for (const auto& id : order_) {
        const IRiskEstimator& est = *estimators_.at(id);
        out.push_back(MethodDescription{id, est.description(), est.suitableContexts()});
    }
    return out;
}

RiskEstimate ModelRegistry::estimate(const std::string& method_id,
                                     const EstimationRequest& request,
                                     AdverseEventType type) const {
    if (!(request.options.credible_level > 0.0 && request.options.credible_level < 1.0)) {
        THROW_INVALID_PARAM("ModelRegistry::estimate", "credible level must lie in (0, 1)");
    }
    return get(method_id).estimate(request, type);
}

std::vector<MethodComparisonEntry> ModelRegistry::compare(const std::vector<std::string>& method_ids,
                                                          const EstimationRequest& request,
                                                          AdverseEventType type) const {
    std::vector<MethodComparisonEntry> entries;
    for (const auto& id : method_ids) {
        const IRiskEstimator& est = get(id);
        MethodComparisonEntry entry;
        entry.method_id = id;
        try {
            entry.estimate = est.estimate(request, type);
            entry.succeeded = true;
        } catch (const SafetyException& e) {
            entry.error = e.what();
            logger.warning(LOG_SOURCE, "Method " + id + " failed during comparison: " + e.what());
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

ModelRegistry ModelRegistry::createDefault(std::shared_ptr<const EngineConfiguration> config) {
    ModelRegistry registry;
    registry.registerEstimator(std::make_shared<ClopperPearsonEstimator>());
    registry.registerEstimator(std::make_shared<WilsonScoreEstimator>());
    registry.registerEstimator(std::make_shared<RandomEffectsMetaAnalysis>(config));
    registry.registerEstimator(std::make_shared<EmpiricalBayesShrinkageEstimator>());
    registry.registerEstimator(std::make_shared<KaplanMeierEstimator>());
    registry.registerEstimator(std::make_shared<PredictivePosteriorEstimator>(config));
    registry.registerEstimator(std::make_shared<BayesianBetaBinomialEstimator>(config));
    return registry;
}

} // namespace ctsafety
