#ifndef MITIGATION_COMBINER_HPP
#define MITIGATION_COMBINER_HPP

#include "mitigation/MitigationTypes.hpp"
#include "safety/EngineConfiguration.hpp"
#include "safety/SafetyTypes.hpp"

#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ctsafety {

/**
 * @brief One merge of the greedy pairwise plan. Indices refer to positions in the
 *        pool as it stands when the step runs; the merged value replaces `left`
 *        and `right` is removed.
 */
struct MergeStep {
    int left = 0;
    int right = 0;
    double rho = 0.0;
};

/**
 * @brief Combines the relative risks of concurrently applied, mechanistically correlated
 *        mitigation strategies and propagates the uncertainty to the mitigated risk.
 *
 * Two strategies combine as (RRa * RRb)^(1 - rho) * min(RRa, RRb)^rho. Larger sets are
 * combined greedily: the most correlated pair in the pool merges first (ties go to the
 * earliest pair in input order), and the merged entry's correlation with each remaining
 * entry is the maximum over its members. The same plan is replayed for every Monte Carlo
 * draw, so point and interval estimates share one combination structure.
 */
class MitigationCombiner {
public:
    explicit MitigationCombiner(std::shared_ptr<const EngineConfiguration> config);

    /// @throws InvalidParameterException unless both RRs are positive and rho is in [0, 1].
    static double combinePair(double rr_a, double rr_b, double rho);

    /// Greedy merge order over a symmetric correlation matrix (diagonal ignored).
    static std::vector<MergeStep> mergePlan(const Eigen::MatrixXd& rho);

    /// Replay a merge plan over RRs given in the matrix order.
    static double applyPlan(const std::vector<MergeStep>& plan, std::vector<double> rrs);

    /// Mean, standard deviation and the 2.5 / 50 / 97.5 percentiles of a sample.
    static SampleSummary summarize(std::vector<double> samples);

    /**
     * @brief Combined RR and mitigated risk for `target`.
     *
     * The baseline is the Beta posterior of the target type's own pooled observations
     * under its configured prior (prior only, flagged, when there are none).
     *
     * @param seed    Monte Carlo seed; drawn from std::random_device and reported when absent.
     * @param samples Monte Carlo draws; defaults to the "monte_carlo_samples" setting.
     * @throws InvalidParameterException for an empty, duplicated or unknown strategy id.
     */
    MitigationResult combine(const std::vector<std::string>& strategy_ids,
                             AdverseEventType target,
                             const std::vector<AdverseEventObservation>& observations,
                             std::optional<unsigned long long> seed = std::nullopt,
                             std::optional<int> samples = std::nullopt) const;

    /// Draws are generated in blocks of this size, each from its own seeded generator.
    static constexpr int kBlockSize = 1024;

private:
    std::shared_ptr<const EngineConfiguration> config_;
};

} // namespace ctsafety

#endif // MITIGATION_COMBINER_HPP
