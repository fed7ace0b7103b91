#include "optimizers/HillClimbingOptimizer.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

#include <Eigen/Cholesky>
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace ctsafety {

    static Logger& logger = Logger::getInstance();
    static const std::string LOG_SOURCE = "HILL_CLIMBING";

    static constexpr double INFEASIBLE = -1e300;

    // Maps non-finite objective values to a sentinel below any feasible value.
    static double safe_evaluate(const IObjectiveFunction& func, const Eigen::VectorXd& p) {
        const double val = func.calculate(p);
        return std::isfinite(val) ? val : INFEASIBLE;
    }

    // Backtrack until any improvement is found, then expand along the realized step.
    static bool performLineSearch(
        Eigen::VectorXd& current_params,
        double& current_value,
        const Eigen::VectorXd& direction,
        const IObjectiveFunction& func,
        const IParameterManager& pm)
    {
        const double shrinkage = 0.5;
        const double growth = 2.0;
        const int max_backtrack = 10;
        const int max_expansion = 12;

        double step = 1.0;
        Eigen::VectorXd improved = current_params;
        double improved_value = current_value;
        bool found = false;

        for (int i = 0; i < max_backtrack; ++i) {
            Eigen::VectorXd candidate = pm.applyConstraints(current_params + direction * step);
            if ((candidate - current_params).squaredNorm() < 1e-16) break;

            const double value = safe_evaluate(func, candidate);
            if (value > improved_value) {
                improved = candidate;
                improved_value = value;
                found = true;
                break;
            }
            step *= shrinkage;
        }
        if (!found) return false;

        Eigen::VectorXd best = improved;
        double best_value = improved_value;
        Eigen::VectorXd realized_step = improved - current_params;

        for (int i = 0; i < max_expansion; ++i) {
            realized_step *= growth;
            Eigen::VectorXd candidate = pm.applyConstraints(best + realized_step);
            const double value = safe_evaluate(func, candidate);
            if (value > best_value) {
                best = candidate;
                best_value = value;
            } else {
                break;
            }
        }

        current_params = best;
        current_value = best_value;
        return true;
    }

    void HillClimbingOptimizer::configure(const std::map<std::string, double>& settings) {
        auto get = [&](const std::string& key, double def) {
            auto it = settings.find(key);
            return (it != settings.end()) ? it->second : def;
        };

        iterations_ = std::max(1, static_cast<int>(get("iterations", 300.0)));
        cloud_size_ = std::max(4, static_cast<int>(get("cloud_size", 32.0)));
        stall_iterations_ = std::max(1, static_cast<int>(get("stall_iterations", 40.0)));
        tolerance_ = get("tolerance", 1e-9);
        report_interval_ = std::max(1, static_cast<int>(get("report_interval", 50.0)));
        seed_ = static_cast<std::uint64_t>(get("seed", 20240101.0));

        logger.debug(LOG_SOURCE, "Configured hill climber: iterations=" + std::to_string(iterations_) +
                     ", cloud=" + std::to_string(cloud_size_) + ", seed=" + std::to_string(seed_));
    }

    OptimizationResult HillClimbingOptimizer::optimize(
        const Eigen::VectorXd& initialParameters,
        IObjectiveFunction& objectiveFunction,
        IParameterManager& parameterManager) {

        const int n_params = static_cast<int>(initialParameters.size());
        if (n_params == 0 || n_params != parameterManager.getParameterCount()) {
            THROW_INVALID_PARAM("HillClimbingOptimizer::optimize", "initial parameters do not match the parameter manager");
        }

        OptimizationResult result;
        result.bestParameters = parameterManager.applyConstraints(initialParameters);
        result.bestObjectiveValue = safe_evaluate(objectiveFunction, result.bestParameters);

        Eigen::VectorXd current_params = result.bestParameters;
        double current_value = result.bestObjectiveValue;

        Eigen::MatrixXd cov = Eigen::MatrixXd::Zero(n_params, n_params);
        for (int i = 0; i < n_params; ++i) {
            const double s = parameterManager.getSigmaForParamIndex(i);
            cov(i, i) = s * s;
        }
        Eigen::MatrixXd L = cov.llt().matrixL();

        std::mt19937_64 rng(seed_);
        std::normal_distribution<double> norm(0.0, 1.0);
        std::uniform_int_distribution<int> axis(0, n_params - 1);

        std::vector<Eigen::VectorXd> steps(static_cast<size_t>(cloud_size_), Eigen::VectorXd::Zero(n_params));
        std::vector<Eigen::VectorXd> constrained(static_cast<size_t>(cloud_size_), Eigen::VectorXd::Zero(n_params));
        std::vector<double> scores(static_cast<size_t>(cloud_size_), INFEASIBLE);

        Eigen::VectorXd prev_params = current_params;
        int stalled = 0;
        int iter = 0;

        for (; iter < iterations_ && stalled < stall_iterations_; ++iter) {

            // A. Cloud generation (serial, single generator)
            for (int i = 0; i < cloud_size_; ++i) {
                Eigen::VectorXd& s = steps[static_cast<size_t>(i)];
                if (i < cloud_size_ / 2) {
                    Eigen::VectorXd z(n_params);
                    for (int k = 0; k < n_params; ++k) z(k) = norm(rng);
                    s = L * z;
                } else {
                    const int idx = axis(rng);
                    s.setZero();
                    s(idx) = std::sqrt(cov(idx, idx)) * norm(rng);
                }
            }

            // B. Parallel evaluation
            #pragma omp parallel for schedule(dynamic)
            for (int i = 0; i < cloud_size_; ++i) {
                const size_t u = static_cast<size_t>(i);
                constrained[u] = parameterManager.applyConstraints(current_params + steps[u]);
                scores[u] = safe_evaluate(objectiveFunction, constrained[u]);
            }

            // C. Winner selection (lowest index wins ties)
            int best_idx = 0;
            for (int i = 1; i < cloud_size_; ++i) {
                if (scores[static_cast<size_t>(i)] > scores[static_cast<size_t>(best_idx)]) best_idx = i;
            }

            // D. Accept and line search
            const double before = current_value;
            if (scores[static_cast<size_t>(best_idx)] > INFEASIBLE) {
                const Eigen::VectorXd winner = constrained[static_cast<size_t>(best_idx)];
                const Eigen::VectorXd direction = winner - current_params;
                if (scores[static_cast<size_t>(best_idx)] > current_value) {
                    current_params = winner;
                    current_value = scores[static_cast<size_t>(best_idx)];
                }
                performLineSearch(current_params, current_value, direction, objectiveFunction, parameterManager);
            }

            const bool moved = current_value > before + tolerance_;
            stalled = moved ? 0 : stalled + 1;

            // E. Covariance adaptation from the realized step
            if (moved) {
                if (current_value > result.bestObjectiveValue) {
                    result.bestObjectiveValue = current_value;
                    result.bestParameters = current_params;
                }
                const Eigen::VectorXd actual_step = current_params - prev_params;
                if (actual_step.squaredNorm() > 1e-14) {
                    const double alpha = 2.0 / (n_params + 2.0);
                    cov = (1.0 - alpha) * cov + alpha * (actual_step * actual_step.transpose());
                    cov = 0.5 * (cov + cov.transpose());
                    cov += (1e-8 * cov.trace() / n_params) * Eigen::MatrixXd::Identity(n_params, n_params);
                    for (int i = 0; i < n_params; ++i) {
                        const double s = parameterManager.getSigmaForParamIndex(i);
                        cov(i, i) = std::max(cov(i, i), 0.01 * s * s);
                    }
                }
                prev_params = current_params;
            }

            // F. Refresh the Cholesky factor
            if (iter > 0 && iter % 10 == 0) {
                Eigen::LLT<Eigen::MatrixXd> llt(cov);
                if (llt.info() == Eigen::Success) {
                    L = llt.matrixL();
                } else {
                    cov = Eigen::MatrixXd(cov.diagonal().asDiagonal());
                    L = cov.diagonal().cwiseSqrt().asDiagonal();
                    logger.warning(LOG_SOURCE, "Covariance reset to diagonal due to instability");
                }
            }

            if ((iter + 1) % report_interval_ == 0) {
                logger.debug(LOG_SOURCE, "Iter " + std::to_string(iter + 1) +
                             " | Best: " + std::to_string(result.bestObjectiveValue));
            }
        }

        result.finalCovariance = cov;
        result.iterations = iter;
        logger.debug(LOG_SOURCE, "Finished after " + std::to_string(iter) + " iterations, best objective " +
                     std::to_string(result.bestObjectiveValue));
        return result;
    }

} // namespace ctsafety
