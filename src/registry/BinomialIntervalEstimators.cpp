#include "registry/BinomialIntervalEstimators.hpp"
#include "exceptions/Exceptions.hpp"
#include "safety/ObservationPooling.hpp"

#include <boost/math/distributions/normal.hpp>
#include <boost/math/special_functions/beta.hpp>

#include <cmath>

namespace ctsafety {

namespace {

void validateInterval(int x, int n, double level, const std::string& where) {
    if (n <= 0 || x < 0 || x > n) {
        THROW_INVALID_PARAM(where, "require 0 <= x <= n and n > 0");
    }
    if (!(level > 0.0 && level < 1.0)) {
        THROW_INVALID_PARAM(where, "level must lie in (0, 1)");
    }
}

void recordCounts(Diagnostics& d, const PooledCounts& pooled) {
    d.values["events"] = pooled.events;
    d.values["n"] = pooled.n;
    d.values["studies"] = pooled.studies;
}

} // namespace

// --- Clopper-Pearson ---

std::string ClopperPearsonEstimator::description() const {
    return "Exact binomial interval from Beta quantiles; guaranteed nominal coverage";
}

std::vector<std::string> ClopperPearsonEstimator::suitableContexts() const {
    return {"regulatory reporting", "small single-arm cohorts", "zero-event summaries"};
}

CredibleInterval ClopperPearsonEstimator::interval(int x, int n, double level) {
    validateInterval(x, n, level, "ClopperPearsonEstimator::interval");
    const double alpha = 1.0 - level;
    CredibleInterval ci;
    ci.level = level;
    ci.lower = (x == 0) ? 0.0 : boost::math::ibeta_inv(static_cast<double>(x), static_cast<double>(n - x + 1), alpha / 2.0);
    ci.upper = (x == n) ? 1.0 : boost::math::ibeta_inv(static_cast<double>(x + 1), static_cast<double>(n - x), 1.0 - alpha / 2.0);
    return ci;
}

RiskEstimate ClopperPearsonEstimator::estimate(const EstimationRequest& request, AdverseEventType type) const {
    const PooledCounts pooled = pooledCountsForType(request.observations, type, "ClopperPearsonEstimator::estimate");

    RiskEstimate result;
    result.method_name = methodId();
    result.point = static_cast<double>(pooled.events) / pooled.n;
    result.interval = interval(pooled.events, pooled.n, request.options.credible_level);
    recordCounts(result.diagnostics, pooled);
    return result;
}

// --- Wilson score ---

std::string WilsonScoreEstimator::description() const {
    return "Wilson score interval; well behaved for small n and rates near 0 or 1";
}

std::vector<std::string> WilsonScoreEstimator::suitableContexts() const {
    return {"small samples", "rare events", "quick screening estimates"};
}

CredibleInterval WilsonScoreEstimator::interval(int x, int n, double level, bool continuity_correction) {
    validateInterval(x, n, level, "WilsonScoreEstimator::interval");
    const double z = boost::math::quantile(boost::math::normal_distribution<double>(0.0, 1.0), 0.5 * (1.0 + level));
    const double z2 = z * z;
    const double nn = static_cast<double>(n);
    const double p = static_cast<double>(x) / nn;

    CredibleInterval ci;
    ci.level = level;

    if (!continuity_correction) {
        const double denom = 1.0 + z2 / nn;
        const double center = (p + z2 / (2.0 * nn)) / denom;
        const double half = z * std::sqrt(p * (1.0 - p) / nn + z2 / (4.0 * nn * nn)) / denom;
        ci.lower = center - half;
        ci.upper = center + half;
        // Analytically exact at the boundaries; removes rounding residue.
        if (x == 0) ci.lower = 0.0;
        if (x == n) ci.upper = 1.0;
        return ci;
    }

    // Newcombe (1998), method 4.
    const double denom = 2.0 * (nn + z2);
    if (x == 0) {
        ci.lower = 0.0;
    } else {
        const double root = std::sqrt(z2 - 2.0 - 1.0 / nn + 4.0 * p * (nn * (1.0 - p) + 1.0));
        ci.lower = (2.0 * nn * p + z2 - 1.0 - z * root) / denom;
    }
    if (x == n) {
        ci.upper = 1.0;
    } else {
        const double root = std::sqrt(z2 + 2.0 - 1.0 / nn + 4.0 * p * (nn * (1.0 - p) - 1.0));
        ci.upper = (2.0 * nn * p + z2 + 1.0 + z * root) / denom;
    }
    return ci;
}

RiskEstimate WilsonScoreEstimator::estimate(const EstimationRequest& request, AdverseEventType type) const {
    const PooledCounts pooled = pooledCountsForType(request.observations, type, "WilsonScoreEstimator::estimate");

    RiskEstimate result;
    result.method_name = methodId();
    result.point = static_cast<double>(pooled.events) / pooled.n;
    result.interval = interval(pooled.events, pooled.n, request.options.credible_level,
                               request.options.continuity_correction);
    recordCounts(result.diagnostics, pooled);
    if (request.options.continuity_correction) {
        result.diagnostics.flag("continuity_correction");
    }
    return result;
}

} // namespace ctsafety
