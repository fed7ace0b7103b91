#ifndef IRISK_ESTIMATOR_HPP
#define IRISK_ESTIMATOR_HPP

#include "registry/RegistryTypes.hpp"

#include <string>
#include <vector>

namespace ctsafety {

/**
 * @class IRiskEstimator
 * @brief Common contract of the point/interval estimators held by the ModelRegistry.
 *
 * Implementations are stateless apart from immutable configuration, so a single instance
 * may be shared across threads.
 */
class IRiskEstimator {
public:
    virtual ~IRiskEstimator() = default;

    /// Registry key, e.g. "clopper_pearson".
    virtual std::string methodId() const = 0;

    virtual std::string description() const = 0;

    virtual std::vector<std::string> suitableContexts() const = 0;

    /**
     * @brief Estimate the event rate for `type` from the request.
     * @throws InvalidParameterException when the request lacks data the method needs.
     * @throws DataInconsistencyException when the data contradict themselves.
     */
    virtual RiskEstimate estimate(const EstimationRequest& request, AdverseEventType type) const = 0;
};

} // namespace ctsafety

#endif // IRISK_ESTIMATOR_HPP
