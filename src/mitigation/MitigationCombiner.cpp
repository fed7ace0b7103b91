#include "mitigation/MitigationCombiner.hpp"
#include "evidence/BetaBinomialEngine.hpp"
#include "exceptions/Exceptions.hpp"
#include "safety/ObservationPooling.hpp"
#include "utils/Logger.hpp"

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/variance.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <set>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace ba = boost::accumulators;

namespace ctsafety {

static Logger& logger = Logger::getInstance();
static const std::string LOG_SOURCE = "MITIGATION_COMBINER";

namespace {

using SummaryAccumulator = ba::accumulator_set<double,
    ba::stats<
        ba::tag::mean,
        ba::tag::variance(ba::lazy),
        ba::tag::min,
        ba::tag::max,
        ba::tag::count
    >
>;

// 1.96 for a 95% interval on the log scale.
constexpr double kZ975 = 1.959963984540054;

inline double geometricInterpolation(double a, double b, double rho) {
    return std::pow(a * b, 1.0 - rho) * std::pow(std::min(a, b), rho);
}

// Linear interpolation between order statistics of a sorted sample.
double percentile(const std::vector<double>& sorted, double q) {
    if (sorted.size() == 1) return sorted.front();
    const double h = q * static_cast<double>(sorted.size() - 1);
    const std::size_t lo = static_cast<std::size_t>(std::floor(h));
    const std::size_t hi = std::min(lo + 1, sorted.size() - 1);
    return sorted[lo] + (h - static_cast<double>(lo)) * (sorted[hi] - sorted[lo]);
}

} // namespace

MitigationCombiner::MitigationCombiner(std::shared_ptr<const EngineConfiguration> config)
    : config_(std::move(config))
{
    if (!config_) {
        THROW_INVALID_PARAM("MitigationCombiner", "configuration must not be null");
    }
}

double MitigationCombiner::combinePair(double rr_a, double rr_b, double rho) {
    if (!(rr_a > 0.0) || !(rr_b > 0.0) || !std::isfinite(rr_a) || !std::isfinite(rr_b)) {
        THROW_INVALID_PARAM("MitigationCombiner::combinePair", "relative risks must be positive and finite");
    }
    if (!(rho >= 0.0 && rho <= 1.0)) {
        THROW_INVALID_PARAM("MitigationCombiner::combinePair", "rho must lie in [0, 1]");
    }
    return geometricInterpolation(rr_a, rr_b, rho);
}

std::vector<MergeStep> MitigationCombiner::mergePlan(const Eigen::MatrixXd& rho) {
    if (rho.rows() != rho.cols()) {
        THROW_INVALID_PARAM("MitigationCombiner::mergePlan", "correlation matrix must be square");
    }
    const int n = static_cast<int>(rho.rows());
    Eigen::MatrixXd r = rho;
    std::vector<int> active(n);
    for (int i = 0; i < n; ++i) active[i] = i;

    std::vector<MergeStep> plan;
    while (active.size() > 1) {
        MergeStep best{0, 1, -1.0};
        for (int i = 0; i < static_cast<int>(active.size()); ++i) {
            for (int j = i + 1; j < static_cast<int>(active.size()); ++j) {
                const double v = r(active[i], active[j]);
                if (v > best.rho) best = MergeStep{i, j, v};
            }
        }
        const int ra = active[best.left];
        const int rb = active[best.right];
        for (int k = 0; k < n; ++k) {
            const double m = std::max(r(ra, k), r(rb, k));
            r(ra, k) = m;
            r(k, ra) = m;
        }
        active.erase(active.begin() + best.right);
        plan.push_back(best);
    }
    return plan;
}

double MitigationCombiner::applyPlan(const std::vector<MergeStep>& plan, std::vector<double> rrs) {
    if (rrs.empty()) return 1.0;
    for (const auto& step : plan) {
        rrs[step.left] = geometricInterpolation(rrs[step.left], rrs[step.right], step.rho);
        rrs.erase(rrs.begin() + step.right);
    }
    return rrs.front();
}

SampleSummary MitigationCombiner::summarize(std::vector<double> samples) {
    SampleSummary s;
    if (samples.empty()) return s;

    SummaryAccumulator acc;
    for (double v : samples) acc(v);

    s.samples = static_cast<int>(ba::count(acc));
    s.mean = ba::mean(acc);
    s.std_dev = std::sqrt(ba::variance(acc));
    s.min = ba::min(acc);
    s.max = ba::max(acc);

    std::sort(samples.begin(), samples.end());
    s.median = percentile(samples, 0.5);
    s.lower = percentile(samples, 0.025);
    s.upper = percentile(samples, 0.975);
    return s;
}

MitigationResult MitigationCombiner::combine(const std::vector<std::string>& strategy_ids,
                                             AdverseEventType target,
                                             const std::vector<AdverseEventObservation>& observations,
                                             std::optional<unsigned long long> seed,
                                             std::optional<int> samples) const {
    const std::string where = "MitigationCombiner::combine";
    if (strategy_ids.empty()) {
        THROW_INVALID_PARAM(where, "at least one strategy id is required");
    }
    std::set<std::string> seen;
    for (const auto& id : strategy_ids) {
        if (!config_->hasStrategy(id)) THROW_INVALID_PARAM(where, "unknown mitigation strategy '" + id + "'");
        if (!seen.insert(id).second) THROW_INVALID_PARAM(where, "strategy '" + id + "' listed twice");
    }

    MitigationResult result;
    result.target = target;

    std::vector<const MitigationStrategy*> applied;
    for (const auto& id : strategy_ids) {
        const MitigationStrategy& s = config_->strategy(id);
        if (s.targets(target)) {
            applied.push_back(&s);
            result.applied_strategies.push_back(id);
        } else {
            result.not_applicable.push_back(id);
        }
    }
    if (!result.not_applicable.empty()) {
        result.diagnostics.flag("strategies_not_applicable");
    }
    if (applied.empty()) {
        result.diagnostics.flag("no_applicable_strategies");
        logger.warning(LOG_SOURCE, "None of the selected strategies targets " + toString(target));
    }

    const CorrelationMatrix& correlations = config_->correlations();
    for (std::size_t i = 0; i < applied.size(); ++i) {
        for (std::size_t j = i + 1; j < applied.size(); ++j) {
            if (applied[i]->sharesPathwayWith(*applied[j]) && !correlations.contains(applied[i]->id, applied[j]->id)) {
                result.default_independence_pairs.emplace_back(applied[i]->id, applied[j]->id);
            }
        }
    }
    if (!result.default_independence_pairs.empty()) {
        result.diagnostics.flag("default_independence_assumed");
        logger.warning(LOG_SOURCE, std::to_string(result.default_independence_pairs.size()) +
                       " strategy pair(s) share a pathway but have no correlation entry; rho = 0 assumed");
    }

    // Point combination and per-step detail.
    const std::vector<std::string>& ids = result.applied_strategies;
    std::vector<double> point_rr;
    for (const auto* s : applied) point_rr.push_back(s->relative_risk);
    const std::vector<MergeStep> plan = mergePlan(correlations.toDense(ids));

    {
        std::vector<double> values = point_rr;
        std::vector<std::vector<std::string>> members;
        std::vector<std::string> labels;
        for (const auto& id : ids) {
            members.push_back({id});
            labels.push_back(id);
        }
        for (const auto& step : plan) {
            PairwiseCorrection c;
            c.left = labels[step.left];
            c.right = labels[step.right];
            c.rho = step.rho;
            for (const auto& a : members[step.left]) {
                for (const auto& b : members[step.right]) {
                    if (correlations.contains(a, b)) c.explicit_correlation = true;
                }
            }
            c.rr_left = values[step.left];
            c.rr_right = values[step.right];
            c.independent_product = c.rr_left * c.rr_right;
            c.combined = combinePair(c.rr_left, c.rr_right, step.rho);
            result.pairwise_detail.push_back(c);

            values[step.left] = c.combined;
            labels[step.left] = "(" + c.left + "+" + c.right + ")";
            members[step.left].insert(members[step.left].end(), members[step.right].begin(), members[step.right].end());
            values.erase(values.begin() + step.right);
            labels.erase(labels.begin() + step.right);
            members.erase(members.begin() + step.right);
        }
        result.combined_rr = values.empty() ? 1.0 : values.front();
    }
    result.naive_product = 1.0;
    for (double v : point_rr) result.naive_product *= v;

    // Uncertain versus confirmed benefit.
    std::vector<std::string> confirmed_ids;
    std::vector<double> confirmed_rr;
    for (const auto* s : applied) {
        if (s->uncertainBenefit()) {
            result.uncertain_benefit.push_back(s->id);
        } else {
            confirmed_ids.push_back(s->id);
            confirmed_rr.push_back(s->relative_risk);
        }
    }
    if (!result.uncertain_benefit.empty()) {
        result.diagnostics.flag("uncertain_benefit");
    }
    if (!confirmed_ids.empty()) {
        result.confirmed_benefit = confirmed_ids;
        result.confirmed_benefit_rr = applyPlan(mergePlan(correlations.toDense(confirmed_ids)), confirmed_rr);
    }

    // Baseline from the target type's own observations.
    const BetaBinomialEngine engine(config_->prior(target), config_->credibleLevel());
    const PooledCounts pooled = poolCounts(latestCountsPerStudy(observations, target));
    if (pooled.n > 0) {
        result.baseline = engine.posterior(pooled.events, pooled.n);
        result.diagnostics.values["baseline_events"] = pooled.events;
        result.diagnostics.values["baseline_n"] = pooled.n;
    } else {
        const PriorSpecification& prior = engine.prior();
        result.baseline = engine.posteriorFromParameters(prior.alpha(), prior.beta(), IntervalMethod::ExactBetaQuantile);
        result.diagnostics.flag("baseline_prior_only");
        result.diagnostics.note("no " + toString(target) + " observations; baseline is the prior");
    }
    if (result.baseline.degraded) {
        result.diagnostics.flag("baseline_interval_degraded");
    }
    result.mitigated_risk = std::min(result.baseline.mean * result.combined_rr, 1.0);

    // Monte Carlo propagation.
    const int draws = samples.value_or(static_cast<int>(config_->setting("monte_carlo_samples", 10000)));
    if (draws < 1) {
        THROW_INVALID_PARAM(where, "Monte Carlo sample count must be positive");
    }
    if (seed) {
        result.seed = *seed;
    } else {
        std::random_device rd;
        result.seed = (static_cast<unsigned long long>(rd()) << 32) ^ static_cast<unsigned long long>(rd());
        result.diagnostics.note("Monte Carlo seed drawn from std::random_device: " + std::to_string(result.seed));
    }

    std::vector<double> log_rr(applied.size());
    std::vector<double> se(applied.size());
    for (std::size_t j = 0; j < applied.size(); ++j) {
        log_rr[j] = std::log(applied[j]->relative_risk);
        se[j] = (std::log(applied[j]->ci_high) - std::log(applied[j]->ci_low)) / (2.0 * kZ975);
    }

    const double alpha_post = result.baseline.alpha_post;
    const double beta_post = result.baseline.beta_post;
    const double baseline_mean = result.baseline.mean;
    const unsigned long long used_seed = result.seed;
    const int blocks = (draws + kBlockSize - 1) / kBlockSize;
    std::vector<double> rr_draws(static_cast<std::size_t>(draws));
    std::vector<double> risk_draws(static_cast<std::size_t>(draws));

    #pragma omp parallel for schedule(static)
    for (int b = 0; b < blocks; ++b) {
        std::seed_seq seq{static_cast<std::uint32_t>(used_seed & 0xffffffffULL),
                          static_cast<std::uint32_t>(used_seed >> 32),
                          static_cast<std::uint32_t>(b)};
        std::mt19937_64 gen(seq);
        std::gamma_distribution<double> gamma_a(alpha_post, 1.0);
        std::gamma_distribution<double> gamma_b(beta_post, 1.0);
        std::normal_distribution<double> z(0.0, 1.0);
        std::vector<double> rr(log_rr.size());

        const int end = std::min(draws, (b + 1) * kBlockSize);
        for (int s = b * kBlockSize; s < end; ++s) {
            const double x = gamma_a(gen);
            const double y = gamma_b(gen);
            const double p = (x + y > 0.0) ? x / (x + y) : baseline_mean;
            for (std::size_t j = 0; j < rr.size(); ++j) {
                rr[j] = se[j] > 0.0 ? std::exp(log_rr[j] + se[j] * z(gen)) : std::exp(log_rr[j]);
            }
            const double combined = applyPlan(plan, rr);
            rr_draws[static_cast<std::size_t>(s)] = combined;
            // Uncertain strategies can draw an RR above 1.
            risk_draws[static_cast<std::size_t>(s)] = std::min(p * combined, 1.0);
        }
    }

    result.rr_distribution = summarize(std::move(rr_draws));
    result.risk_distribution = summarize(std::move(risk_draws));
    result.diagnostics.values["monte_carlo_samples"] = draws;

    logger.info(LOG_SOURCE, toString(target) + ": combined RR " + std::to_string(result.combined_rr) +
                " (naive " + std::to_string(result.naive_product) + ") over " +
                std::to_string(applied.size()) + " strategies, mitigated risk " +
                std::to_string(result.mitigated_risk));
    return result;
}

} // namespace ctsafety
