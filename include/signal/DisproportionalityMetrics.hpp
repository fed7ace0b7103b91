#ifndef DISPROPORTIONALITY_METRICS_HPP
#define DISPROPORTIONALITY_METRICS_HPP

#include "safety/EngineConfiguration.hpp"
#include "signal/SignalTypes.hpp"

namespace ctsafety {

/**
 * @brief Frequentist disproportionality ratios on a 2x2 report table.
 *
 * When any cell is zero, 0.5 is added to every cell (Haldane-Anscombe) before both the
 * ratio and its standard error are computed. Intervals use the delta method on the log scale.
 */
class DisproportionalityMetrics {
public:
    /// PRR = [a/(a+b)] / [c/(c+d)], SE(ln PRR) = sqrt(1/a - 1/(a+b) + 1/c - 1/(c+d)).
    static RatioEstimate proportionalReportingRatio(const ContingencyTable& table, double level = 0.95);

    /// ROR = ad/(bc), SE(ln ROR) = sqrt(1/a + 1/b + 1/c + 1/d).
    static RatioEstimate reportingOddsRatio(const ContingencyTable& table, double level = 0.95);

    /**
     * @brief Tier from composite thresholds:
     * strong   PRR >= 2, PRR lower > 1, a >= 3, EB05 >= 2
     * moderate PRR >= 2, ROR lower > 1, a >= 3
     * weak     PRR >= 1.5 or EB05 >= 1
     */
    static SignalTier classify(const RatioEstimate& prr,
                               const RatioEstimate& ror,
                               long long cases,
                               double eb05,
                               const SignalThresholds& thresholds);
};

} // namespace ctsafety

#endif // DISPROPORTIONALITY_METRICS_HPP
