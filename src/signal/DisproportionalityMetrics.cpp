#include "signal/DisproportionalityMetrics.hpp"
#include "exceptions/Exceptions.hpp"

#include <boost/math/distributions/normal.hpp>

#include <cmath>

namespace ctsafety {

namespace {

struct CorrectedCells {
    double a, b, c, d;
    bool corrected;
};

CorrectedCells correctedCells(const ContingencyTable& t, const std::string& where) {
    if (t.a < 0 || t.b < 0 || t.c < 0 || t.d < 0) {
        THROW_INVALID_PARAM(where, "contingency cells must be non-negative");
    }
    const bool corrected = t.hasZeroCell();
    const double k = corrected ? 0.5 : 0.0;
    return CorrectedCells{t.a + k, t.b + k, t.c + k, t.d + k, corrected};
}

double zFor(double level, const std::string& where) {
    if (!(level > 0.0 && level < 1.0)) {
        THROW_INVALID_PARAM(where, "confidence level must lie in (0, 1)");
    }
    return boost::math::quantile(boost::math::normal_distribution<double>(0.0, 1.0), 0.5 * (1.0 + level));
}

RatioEstimate logScaleInterval(double log_ratio, double se, double z, double level, bool corrected) {
    RatioEstimate r;
    r.value = std::exp(log_ratio);
    r.lower = std::exp(log_ratio - z * se);
    r.upper = std::exp(log_ratio + z * se);
    r.level = level;
    r.continuity_corrected = corrected;
    return r;
}

} // namespace

RatioEstimate DisproportionalityMetrics::proportionalReportingRatio(const ContingencyTable& table, double level) {
    const std::string where = "DisproportionalityMetrics::proportionalReportingRatio";
    const double z = zFor(level, where);
    const CorrectedCells x = correctedCells(table, where);

    const double log_prr = std::log(x.a / (x.a + x.b)) - std::log(x.c / (x.c + x.d));
    const double se = std::sqrt(1.0 / x.a - 1.0 / (x.a + x.b) + 1.0 / x.c - 1.0 / (x.c + x.d));
    return logScaleInterval(log_prr, se, z, level, x.corrected);
}

RatioEstimate DisproportionalityMetrics::reportingOddsRatio(const ContingencyTable& table, double level) {
    const std::string where = "DisproportionalityMetrics::reportingOddsRatio";
    const double z = zFor(level, where);
    const CorrectedCells x = correctedCells(table, where);

    const double log_ror = std::log(x.a) + std::log(x.d) - std::log(x.b) - std::log(x.c);
    const double se = std::sqrt(1.0 / x.a + 1.0 / x.b + 1.0 / x.c + 1.0 / x.d);
    return logScaleInterval(log_ror, se, z, level, x.corrected);
}

SignalTier DisproportionalityMetrics::classify(const RatioEstimate& prr,
                                               const RatioEstimate& ror,
                                               long long cases,
                                               double eb05,
                                               const SignalThresholds& t) {
    if (prr.value >= t.strong_prr && prr.lower > 1.0 && cases >= t.min_cases && eb05 >= t.strong_eb05) {
        return SignalTier::Strong;
    }
    if (prr.value >= t.moderate_prr && ror.lower > 1.0 && cases >= t.min_cases) {
        return SignalTier::Moderate;
    }
    if (prr.value >= t.weak_prr || eb05 >= t.weak_eb05) {
        return SignalTier::Weak;
    }
    return SignalTier::None;
}

} // namespace ctsafety
