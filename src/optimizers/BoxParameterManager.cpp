#include "optimizers/BoxParameterManager.hpp"
#include "exceptions/Exceptions.hpp"

namespace ctsafety {

BoxParameterManager::BoxParameterManager(std::vector<std::string> names,
                                         Eigen::VectorXd lower,
                                         Eigen::VectorXd upper,
                                         Eigen::VectorXd sigmas)
    : names_(std::move(names)), lower_(std::move(lower)), upper_(std::move(upper)), sigmas_(std::move(sigmas))
{
    const Eigen::Index n = static_cast<Eigen::Index>(names_.size());
    if (lower_.size() != n || upper_.size() != n || sigmas_.size() != n) {
        THROW_INVALID_PARAM("BoxParameterManager", "names, bounds and sigmas must have the same length");
    }
    if ((lower_.array() > upper_.array()).any()) {
        THROW_INVALID_PARAM("BoxParameterManager", "lower bound exceeds upper bound");
    }
    if ((sigmas_.array() <= 0.0).any()) {
        THROW_INVALID_PARAM("BoxParameterManager", "proposal sigmas must be positive");
    }
}

Eigen::VectorXd BoxParameterManager::applyConstraints(const Eigen::VectorXd& parameters) const {
    return parameters.cwiseMax(lower_).cwiseMin(upper_);
}

double BoxParameterManager::getSigmaForParamIndex(int index) const {
    if (index < 0 || index >= sigmas_.size()) {
        THROW_INVALID_PARAM("BoxParameterManager::getSigmaForParamIndex", "index out of range");
    }
    return sigmas_(index);
}

} // namespace ctsafety
