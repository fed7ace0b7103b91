#ifndef MITIGATION_TYPES_HPP
#define MITIGATION_TYPES_HPP

#include "safety/SafetyTypes.hpp"

#include <Eigen/Dense>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace ctsafety {

/**
 * @brief A risk-reducing intervention with its relative risk and 95% confidence interval.
 */
struct MitigationStrategy {
    std::string id;
    std::string name;
    double relative_risk = 1.0;
    double ci_low = 1.0;
    double ci_high = 1.0;
    std::set<AdverseEventType> target_adverse_events;
    EvidenceLevel evidence_level = EvidenceLevel::Limited;
    std::set<std::string> pathways;

    /// @throws InvalidParameterException unless 0 < ci_low <= RR <= ci_high.
    void validate() const;

    bool targets(AdverseEventType type) const { return target_adverse_events.count(type) > 0; }

    /// Upper bound reaching 1.0 means a risk increase is not excluded.
    bool uncertainBenefit() const { return ci_high >= 1.0; }

    bool sharesPathwayWith(const MitigationStrategy& other) const;
};

/**
 * @brief Symmetric pairwise correlation (pathway overlap) between strategies.
 *
 * Entries must lie in [0, 1]. Missing pairs read as 0 (independence). Setting the same
 * pair twice is an error rather than a silent overwrite.
 */
class CorrelationMatrix {
public:
    void set(const std::string& a, const std::string& b, double rho);

    std::optional<double> find(const std::string& a, const std::string& b) const;
    bool contains(const std::string& a, const std::string& b) const { return find(a, b).has_value(); }

    /// Explicit entry, 1.0 on the diagonal, 0.0 when absent.
    double get(const std::string& a, const std::string& b) const;

    /// Dense matrix over `ids` in the given order.
    Eigen::MatrixXd toDense(const std::vector<std::string>& ids) const;

    std::size_t size() const { return entries_.size(); }
    const std::map<std::pair<std::string, std::string>, double>& entries() const { return entries_; }

private:
    static std::pair<std::string, std::string> key(const std::string& a, const std::string& b);

    std::map<std::pair<std::string, std::string>, double> entries_;
};

/**
 * @brief One step of the greedy pairwise merge and its correction relative to independence.
 */
struct PairwiseCorrection {
    std::string left;
    std::string right;
    double rho = 0.0;
    bool explicit_correlation = false;
    double rr_left = 1.0;
    double rr_right = 1.0;
    double independent_product = 1.0;
    double combined = 1.0;

    double correctionFactor() const { return combined / independent_product; }
};

struct SampleSummary {
    int samples = 0;
    double mean = 0.0;
    double std_dev = 0.0;
    double median = 0.0;
    double lower = 0.0;  // 2.5th percentile
    double upper = 0.0;  // 97.5th percentile
    double min = 0.0;
    double max = 0.0;
};

struct MitigationResult {
    AdverseEventType target = AdverseEventType::CRS;
    std::vector<std::string> applied_strategies;
    std::vector<std::string> not_applicable;

    double combined_rr = 1.0;
    double naive_product = 1.0;
    std::vector<PairwiseCorrection> pairwise_detail;

    std::vector<std::string> uncertain_benefit;
    std::vector<std::string> confirmed_benefit;
    std::optional<double> confirmed_benefit_rr;

    std::vector<std::pair<std::string, std::string>> default_independence_pairs;

    PosteriorEstimate baseline;
    double mitigated_risk = 0.0;
    SampleSummary rr_distribution;
    SampleSummary risk_distribution;
    unsigned long long seed = 0;

    Diagnostics diagnostics;
};

} // namespace ctsafety

#endif // MITIGATION_TYPES_HPP
