#ifndef IPARAMETER_MANAGER_HPP
#define IPARAMETER_MANAGER_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace ctsafety {

/**
 * @class IParameterManager
 * @brief Describes the optimizer's search space: constraints and proposal scales.
 */
class IParameterManager {
public:
    virtual ~IParameterManager() = default;

    virtual int getParameterCount() const = 0;

    virtual const std::vector<std::string>& getParameterNames() const = 0;

    /**
     * @brief Project a candidate onto the feasible region. Must be const and thread-safe.
     */
    virtual Eigen::VectorXd applyConstraints(const Eigen::VectorXd& parameters) const = 0;

    /**
     * @brief Initial proposal standard deviation for parameter `index`.
     */
    virtual double getSigmaForParamIndex(int index) const = 0;
};

} // namespace ctsafety

#endif // IPARAMETER_MANAGER_HPP
