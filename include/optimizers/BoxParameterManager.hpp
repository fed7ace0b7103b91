#ifndef BOX_PARAMETER_MANAGER_HPP
#define BOX_PARAMETER_MANAGER_HPP

#include "optimizers/interfaces/IParameterManager.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace ctsafety {

/**
 * @brief Parameter space bounded by an axis-aligned box; constraints clamp each coordinate.
 */
class BoxParameterManager : public IParameterManager {
public:
    /**
     * @throws InvalidParameterException if sizes differ, a lower bound exceeds its upper bound,
     *         or a sigma is not positive.
     */
    BoxParameterManager(std::vector<std::string> names,
                        Eigen::VectorXd lower,
                        Eigen::VectorXd upper,
                        Eigen::VectorXd sigmas);

    int getParameterCount() const override { return static_cast<int>(names_.size()); }
    const std::vector<std::string>& getParameterNames() const override { return names_; }
    Eigen::VectorXd applyConstraints(const Eigen::VectorXd& parameters) const override;
    double getSigmaForParamIndex(int index) const override;

private:
    std::vector<std::string> names_;
    Eigen::VectorXd lower_;
    Eigen::VectorXd upper_;
    Eigen::VectorXd sigmas_;
};

} // namespace ctsafety

#endif // BOX_PARAMETER_MANAGER_HPP
