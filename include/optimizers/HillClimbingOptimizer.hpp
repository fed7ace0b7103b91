#ifndef HILL_CLIMBING_OPTIMIZER_HPP
#define HILL_CLIMBING_OPTIMIZER_HPP

#include "optimizers/interfaces/IOptimizationAlgorithm.hpp"

#include <Eigen/Dense>
#include <cstdint>
#include <map>
#include <string>

namespace ctsafety {

/**
 * @brief Seeded adaptive hill climber ("cloud search").
 *
 * Each iteration:
 * 1. Cloud generation: `cloud_size` candidate steps drawn from one seeded generator
 *    (half correlated moves through the adaptive covariance, half single-axis moves).
 * 2. Parallel evaluation of the constrained candidates (OpenMP when available).
 * 3. Winner selection followed by a backtracking/expanding line search along the
 *    constrained direction of improvement.
 * 4. Covariance adaptation from the accepted step.
 *
 * Candidates are generated serially and evaluated independently, so for a fixed seed
 * the result does not depend on the number of threads.
 */
class HillClimbingOptimizer : public IOptimizationAlgorithm {
public:
    HillClimbingOptimizer() = default;
    ~HillClimbingOptimizer() override = default;

    /**
     * @brief Keys:
     * - "iterations": maximum optimization steps (default 300).
     * - "cloud_size": candidates per step (default 32).
     * - "stall_iterations": stop after this many steps without improvement (default 40).
     * - "tolerance": minimum improvement that counts as progress (default 1e-9).
     * - "report_interval": logging frequency (default 50).
     * - "seed": generator seed (default 20240101).
     */
    void configure(const std::map<std::string, double>& settings) override;

    OptimizationResult optimize(const Eigen::VectorXd& initialParameters,
                                IObjectiveFunction& objectiveFunction,
                                IParameterManager& parameterManager) override;

private:
    int iterations_ = 300;
    int cloud_size_ = 32;
    int stall_iterations_ = 40;
    double tolerance_ = 1e-9;
    int report_interval_ = 50;
    std::uint64_t seed_ = 20240101ULL;
};

} // namespace ctsafety

#endif // HILL_CLIMBING_OPTIMIZER_HPP
