#ifndef MODEL_REGISTRY_HPP
#define MODEL_REGISTRY_HPP

#include "registry/interfaces/IRiskEstimator.hpp"
#include "safety/EngineConfiguration.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ctsafety {

/**
 * @brief Dispatch table of interchangeable risk estimators keyed by method id.
 *
 * Selection is always the caller's decision; the registry never picks a method itself.
 */
class ModelRegistry {
public:
    ModelRegistry() = default;

    /**
     * @brief Add an estimator.
     * @throws InvalidParameterException on a null estimator or an id that is already registered.
     */
    void registerEstimator(std::shared_ptr<const IRiskEstimator> estimator);

    bool contains(const std::string& method_id) const;

    /// @throws InvalidParameterException for an unknown id.
    const IRiskEstimator& get(const std::string& method_id) const;

    std::vector<std::string> methodIds() const;
    std::vector<MethodDescription> listMethods() const;

    RiskEstimate estimate(const std::string& method_id,
                          const EstimationRequest& request,
                          AdverseEventType type) const;

    /**
     * @brief Run several methods on the same request. A failing method is reported with its
     *        error text instead of aborting the comparison; unknown ids still throw.
     */
    std::vector<MethodComparisonEntry> compare(const std::vector<std::string>& method_ids,
                                               const EstimationRequest& request,
                                               AdverseEventType type) const;

    /**
     * @brief Registry holding all seven built-in estimators.
     */
    static ModelRegistry createDefault(std::shared_ptr<const EngineConfiguration> config);

private:
    std::map<std::string, std::shared_ptr<const IRiskEstimator>> estimators_;
    std::vector<std::string> order_;
};

} // namespace ctsafety

#endif // MODEL_REGISTRY_HPP
