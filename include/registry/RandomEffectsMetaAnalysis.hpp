#ifndef RANDOM_EFFECTS_META_ANALYSIS_HPP
#define RANDOM_EFFECTS_META_ANALYSIS_HPP

#include "registry/interfaces/IRiskEstimator.hpp"
#include "safety/EngineConfiguration.hpp"
#include "safety/ObservationPooling.hpp"

#include <Eigen/Dense>
#include <memory>

namespace ctsafety {

/**
 * @brief DerSimonian-Laird pooling on the Freeman-Tukey transformed scale.
 */
struct MetaAnalysisSummary {
    double pooled_transformed = 0.0;
    double se_transformed = 0.0;
    double tau2 = 0.0;
    double q = 0.0;
    double i2 = 0.0;
    int k = 0;
    Eigen::VectorXd weights;  // normalized random-effects weights, study order
};

/**
 * @brief Random-effects meta-analysis of proportions across studies.
 *
 * Each study's latest cumulative counts are transformed with the Freeman-Tukey double
 * arcsine, pooled with DerSimonian-Laird between-study variance, and back-transformed
 * with p = sin^2(t / 2). Heterogeneity (tau^2, Q, I^2) is always reported. A single study
 * reduces to its own exact interval.
 *
 * The heterogeneity policy comes from the configuration: annotate high I^2 and mixed
 * product classes, or reject pooling across them.
 */
class RandomEffectsMetaAnalysis : public IRiskEstimator {
public:
    explicit RandomEffectsMetaAnalysis(std::shared_ptr<const EngineConfiguration> config);

    std::string methodId() const override { return "random_effects_meta"; }
    std::string description() const override;
    std::vector<std::string> suitableContexts() const override;
    RiskEstimate estimate(const EstimationRequest& request, AdverseEventType type) const override;

    static double freemanTukey(int x, int n);
    static double freemanTukeyVariance(int n);
    static double backTransform(double t);

    /// Pool transformed effects; requires at least two studies.
    static MetaAnalysisSummary pool(const Eigen::VectorXd& effects, const Eigen::VectorXd& variances);

    /**
     * @brief Confirm the back-transformed pooled rate lies within the study rates.
     *
     * Study rates are the back-transformed Freeman-Tukey effects, so the range includes
     * the transform's continuity adjustment.
     * @throws DataInconsistencyException if the pooled rate falls outside that range.
     */
    static void checkPooledWithinStudies(const Eigen::VectorXd& effects, double pooled_transformed);

private:
    std::shared_ptr<const EngineConfiguration> config_;
};

} // namespace ctsafety

#endif // RANDOM_EFFECTS_META_ANALYSIS_HPP
