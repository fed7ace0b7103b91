#include "registry/RandomEffectsMetaAnalysis.hpp"
#include "exceptions/Exceptions.hpp"
#include "registry/BinomialIntervalEstimators.hpp"
#include "utils/Logger.hpp"

#include <boost/math/constants/constants.hpp>
#include <boost/math/distributions/normal.hpp>

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace ctsafety {

static Logger& logger = Logger::getInstance();
static const std::string LOG_SOURCE = "META_ANALYSIS";

namespace {

// Each pooled study must carry the counts of its latest raw record, and every study in the
// raw timeline must be pooled.
void verifyAgainstTimelines(const std::vector<AdverseEventObservation>& observations,
                            AdverseEventType type,
                            const std::vector<StudyCounts>& studies) {
    std::map<std::string, const AdverseEventObservation*> latest;
    for (const auto& obs : observations) {
        if (obs.type() != type) continue;
        auto it = latest.find(obs.studyId());
        if (it == latest.end() || obs.timepoint().index > it->second->timepoint().index) {
            latest[obs.studyId()] = &obs;
        }
    }
    if (latest.size() != studies.size()) {
        THROW_DATA_INCONSISTENCY("RandomEffectsMetaAnalysis::estimate",
            std::to_string(latest.size()) + " studies observed but " + std::to_string(studies.size()) + " pooled");
    }
    for (const auto& s : studies) {
        auto it = latest.find(s.study_id);
        if (it == latest.end() || it->second->events() != s.events || it->second->n() != s.n) {
            THROW_DATA_INCONSISTENCY("RandomEffectsMetaAnalysis::estimate",
                "pooled counts for study " + s.study_id + " differ from its latest cumulative record");
        }
    }
}

} // namespace

RandomEffectsMetaAnalysis::RandomEffectsMetaAnalysis(std::shared_ptr<const EngineConfiguration> config)
    : config_(std::move(config))
{
    if (!config_) {
        THROW_INVALID_PARAM("RandomEffectsMetaAnalysis", "configuration must not be null");
    }
}

std::string RandomEffectsMetaAnalysis::description() const {
    return "DerSimonian-Laird random-effects pooling of Freeman-Tukey transformed proportions with tau^2, Q and I^2";
}

std::vector<std::string> RandomEffectsMetaAnalysis::suitableContexts() const {
    return {"multi-study pooling", "cross-trial synthesis", "heterogeneity assessment"};
}

double RandomEffectsMetaAnalysis::freemanTukey(int x, int n) {
    const double n1 = n + 1.0;
    return std::asin(std::sqrt(x / n1)) + std::asin(std::sqrt((x + 1.0) / n1));
}

double RandomEffectsMetaAnalysis::freemanTukeyVariance(int n) {
    return 1.0 / (n + 0.5);
}

double RandomEffectsMetaAnalysis::backTransform(double t) {
    const double s = std::sin(t / 2.0);
    return s * s;
}

void RandomEffectsMetaAnalysis::checkPooledWithinStudies(const Eigen::VectorXd& effects, double pooled_transformed) {
    if (effects.size() == 0) {
        THROW_INVALID_PARAM("RandomEffectsMetaAnalysis::checkPooledWithinStudies", "no study effects");
    }
    constexpr double tolerance = 1e-12;
    const double lo = backTransform(effects.minCoeff());
    const double hi = backTransform(effects.maxCoeff());
    const double p = backTransform(pooled_transformed);
    if (!std::isfinite(p) || p < lo - tolerance || p > hi + tolerance) {
        THROW_DATA_INCONSISTENCY("RandomEffectsMetaAnalysis::checkPooledWithinStudies",
            "pooled rate " + std::to_string(p) + " outside study range [" + std::to_string(lo) + ", " +
            std::to_string(hi) + "]");
    }
}

MetaAnalysisSummary RandomEffectsMetaAnalysis::pool(const Eigen::VectorXd& effects, const Eigen::VectorXd& variances) {
    if (effects.size() < 2 || effects.size() != variances.size()) {
        THROW_INVALID_PARAM("RandomEffectsMetaAnalysis::pool", "need at least two studies with matching variances");
    }
    if ((variances.array() <= 0.0).any()) {
        THROW_INVALID_PARAM("RandomEffectsMetaAnalysis::pool", "within-study variances must be positive");
    }

    MetaAnalysisSummary s;
    s.k = static_cast<int>(effects.size());

    const Eigen::VectorXd w = variances.cwiseInverse();
    const double sum_w = w.sum();
    const double fixed = w.dot(effects) / sum_w;

    s.q = (w.array() * (effects.array() - fixed).square()).sum();
    const double df = s.k - 1.0;
    const double c = sum_w - w.squaredNorm() / sum_w;
    s.tau2 = std::max(0.0, (s.q - df) / c);
    s.i2 = (s.q > df) ? (s.q - df) / s.q : 0.0;

    const Eigen::VectorXd w_re = (variances.array() + s.tau2).inverse().matrix();
    const double sum_w_re = w_re.sum();
    s.pooled_transformed = w_re.dot(effects) / sum_w_re;
    s.se_transformed = std::sqrt(1.0 / sum_w_re);
    s.weights = w_re / sum_w_re;
    return s;
}

RiskEstimate RandomEffectsMetaAnalysis::estimate(const EstimationRequest& request, AdverseEventType type) const {
    const std::vector<StudyCounts> studies = latestCountsPerStudy(request.observations, type);
    if (studies.empty()) {
        THROW_INVALID_PARAM("RandomEffectsMetaAnalysis::estimate", "no observations for adverse event type " + toString(type));
    }
    verifyAgainstTimelines(request.observations, type, studies);
    const PooledCounts pooled = poolCounts(studies);
    const double level = request.options.credible_level;

    RiskEstimate result;
    result.method_name = methodId();
    Diagnostics& diag = result.diagnostics;
    diag.values["studies"] = pooled.studies;
    diag.values["events"] = pooled.events;
    diag.values["n"] = pooled.n;

    if (studies.size() == 1) {
        const StudyCounts& only = studies.front();
        result.point = static_cast<double>(only.events) / only.n;
        result.interval = ClopperPearsonEstimator::interval(only.events, only.n, level);
        diag.values["tau2"] = 0.0;
        diag.values["q"] = 0.0;
        diag.values["i2"] = 0.0;
        diag.flag("single_study_exact_interval");
        return result;
    }

    std::set<std::string> product_classes;
    for (const auto& s : studies) {
        if (!s.product_class.empty()) product_classes.insert(s.product_class);
    }

    const Eigen::Index k = static_cast<Eigen::Index>(studies.size());
    Eigen::VectorXd effects(k);
    Eigen::VectorXd variances(k);
    for (Eigen::Index i = 0; i < k; ++i) {
        const StudyCounts& s = studies[static_cast<size_t>(i)];
        effects(i) = freemanTukey(s.events, s.n);
        variances(i) = freemanTukeyVariance(s.n);
    }

    const MetaAnalysisSummary summary = pool(effects, variances);
    checkPooledWithinStudies(effects, summary.pooled_transformed);
    diag.values["tau2"] = summary.tau2;
    diag.values["q"] = summary.q;
    diag.values["i2"] = summary.i2;
    diag.values["product_classes"] = static_cast<double>(product_classes.size());
    for (Eigen::Index i = 0; i < k; ++i) {
        diag.values["weight:" + studies[static_cast<size_t>(i)].study_id] = summary.weights(i);
    }

    const double i2_limit = config_->setting("heterogeneity_i2_limit", 0.75);
    const bool mixed_products = product_classes.size() > 1;
    const bool high_heterogeneity = summary.i2 > i2_limit;

    if (config_->heterogeneityPolicy() == HeterogeneityPolicy::Reject && (mixed_products || high_heterogeneity)) {
        std::string reason = mixed_products ? "studies span " + std::to_string(product_classes.size()) + " product classes"
                                            : "I^2 " + std::to_string(summary.i2) + " exceeds limit " + std::to_string(i2_limit);
        THROW_DATA_INCONSISTENCY("RandomEffectsMetaAnalysis::estimate", "pooling rejected by heterogeneity policy: " + reason);
    }
    if (mixed_products) {
        diag.flag("mixed_product_classes");
        logger.warning(LOG_SOURCE, "Pooling " + toString(type) + " across " + std::to_string(product_classes.size()) +
                       " product classes");
    }
    if (high_heterogeneity) {
        diag.flag("high_heterogeneity");
    }

    const double z = boost::math::quantile(boost::math::normal_distribution<double>(0.0, 1.0), 0.5 * (1.0 + level));
    const double pi = boost::math::constants::pi<double>();
    double t_lo = summary.pooled_transformed - z * summary.se_transformed;
    double t_hi = summary.pooled_transformed + z * summary.se_transformed;
    if (t_lo < 0.0 || t_hi > pi) {
        diag.flag("interval_truncated_to_support");
        t_lo = std::max(0.0, t_lo);
        t_hi = std::min(pi, t_hi);
    }

    result.point = backTransform(summary.pooled_transformed);
    result.interval = CredibleInterval{backTransform(t_lo), backTransform(t_hi), level};
    diag.note("back-transform p = sin^2(t/2)");
    return result;
}

} // namespace ctsafety
