#ifndef IOBJECTIVE_FUNCTION_HPP
#define IOBJECTIVE_FUNCTION_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace ctsafety {

/**
 * @class IObjectiveFunction
 * @brief Scalar function to be maximized (typically a log-likelihood).
 *
 * `calculate` must be safe to call concurrently from several threads.
 */
class IObjectiveFunction {
public:
    virtual ~IObjectiveFunction() = default;

    /**
     * @param parameters Point in the optimizer's (unconstrained) parameter space.
     * @return Objective value; non-finite values are treated as infeasible.
     */
    virtual double calculate(const Eigen::VectorXd& parameters) const = 0;

    virtual const std::vector<std::string>& getParameterNames() const = 0;
};

} // namespace ctsafety

#endif // IOBJECTIVE_FUNCTION_HPP
