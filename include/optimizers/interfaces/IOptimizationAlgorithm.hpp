#ifndef IOPTIMIZATION_ALGORITHM_HPP
#define IOPTIMIZATION_ALGORITHM_HPP

#include "optimizers/interfaces/IObjectiveFunction.hpp"
#include "optimizers/interfaces/IParameterManager.hpp"

#include <Eigen/Dense>
#include <map>
#include <string>

namespace ctsafety {

struct OptimizationResult {
    Eigen::VectorXd bestParameters;
    double bestObjectiveValue = 0.0;
    Eigen::MatrixXd finalCovariance;
    int iterations = 0;
};

/**
 * @class IOptimizationAlgorithm
 * @brief Maximizes an IObjectiveFunction over the space described by an IParameterManager.
 */
class IOptimizationAlgorithm {
public:
    virtual ~IOptimizationAlgorithm() = default;

    virtual void configure(const std::map<std::string, double>& settings) = 0;

    virtual OptimizationResult optimize(const Eigen::VectorXd& initialParameters,
                                        IObjectiveFunction& objectiveFunction,
                                        IParameterManager& parameterManager) = 0;
};

} // namespace ctsafety

#endif // IOPTIMIZATION_ALGORITHM_HPP
