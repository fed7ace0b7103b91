#include "evidence/BetaBinomialEngine.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

#include <boost/math/distributions/beta.hpp>
#include <boost/math/distributions/normal.hpp>
#include <boost/math/special_functions/beta.hpp>
#include <boost/math/special_functions/digamma.hpp>
#include <boost/math/special_functions/gamma.hpp>
#include <boost/math/special_functions/trigamma.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace ctsafety {

static Logger& logger = Logger::getInstance();
static const std::string LOG_SOURCE = "EVIDENCE_ENGINE";

double PredictiveDistribution::probabilityAtLeast(int k) const {
    if (k <= 0) return 1.0;
    double p = 0.0;
    for (std::size_t i = static_cast<std::size_t>(k); i < pmf.size(); ++i) p += pmf[i];
    return p;
}

BetaBinomialEngine::BetaBinomialEngine(PriorSpecification prior, double credible_level)
    : prior_(std::move(prior)), credible_level_(credible_level)
{
    if (!(credible_level_ > 0.0 && credible_level_ < 1.0)) {
        THROW_INVALID_PARAM("BetaBinomialEngine", "credible level must lie in (0, 1)");
    }
}

void BetaBinomialEngine::validateCounts(int events, int n, const std::string& where) {
    if (events < 0) THROW_INVALID_PARAM(where, "events must be non-negative");
    if (n <= 0) THROW_INVALID_PARAM(where, "n must be positive");
    if (events > n) {
        THROW_INVALID_PARAM(where, "events (" + std::to_string(events) + ") cannot exceed n (" + std::to_string(n) + ")");
    }
}

CredibleInterval BetaBinomialEngine::exactBetaInterval(double a, double b, double level) {
    const double tail = 0.5 * (1.0 - level);
    double lo = 0.0;
    double hi = 0.0;
    try {
        boost::math::beta_distribution<double> dist(a, b);
        lo = boost::math::quantile(dist, tail);
        hi = boost::math::quantile(dist, 1.0 - tail);
    } catch (const std::exception& e) {
        throw NumericalException("BetaBinomialEngine::exactBetaInterval",
            "Beta(" + std::to_string(a) + ", " + std::to_string(b) + ") quantile failed: " + e.what());
    }
    if (!std::isfinite(lo) || !std::isfinite(hi) || lo > hi || lo < 0.0 || hi > 1.0) {
        throw NumericalException("BetaBinomialEngine::exactBetaInterval",
            "Beta quantile returned an invalid interval for a=" + std::to_string(a) + ", b=" + std::to_string(b));
    }
    return CredibleInterval{lo, hi, level};
}

CredibleInterval BetaBinomialEngine::logitNormalInterval(double a, double b, double level) {
    const double m = boost::math::digamma(a) - boost::math::digamma(b);
    const double sd = std::sqrt(boost::math::trigamma(a) + boost::math::trigamma(b));
    const double z = boost::math::quantile(boost::math::normal_distribution<double>(0.0, 1.0), 0.5 * (1.0 + level));

    auto logistic = [](double x) { return 1.0 / (1.0 + std::exp(-x)); };
    return CredibleInterval{logistic(m - z * sd), logistic(m + z * sd), level};
}

PosteriorEstimate BetaBinomialEngine::posterior(int events, int n) const {
    return posterior(events, n, IntervalMethod::ExactBetaQuantile);
}

PosteriorEstimate BetaBinomialEngine::posterior(int events, int n, IntervalMethod requested) const {
    validateCounts(events, n, "BetaBinomialEngine::posterior");
    return posteriorFromParameters(prior_.alpha() + events,
                                   prior_.beta() + static_cast<double>(n - events),
                                   requested);
}

PosteriorEstimate BetaBinomialEngine::posteriorFromParameters(double alpha_post,
                                                              double beta_post,
                                                              IntervalMethod requested) const {
    if (!(alpha_post > 0.0) || !(beta_post > 0.0)) {
        THROW_INVALID_PARAM("BetaBinomialEngine::posteriorFromParameters", "posterior parameters must be positive");
    }

    PosteriorEstimate est;
    est.alpha_post = alpha_post;
    est.beta_post = beta_post;
    est.mean = alpha_post / (alpha_post + beta_post);
    est.method = requested;

    if (requested == IntervalMethod::ExactBetaQuantile) {
        try {
            est.interval = exactBetaInterval(alpha_post, beta_post, credible_level_);
            return est;
        } catch (const NumericalException& e) {
            logger.warning(LOG_SOURCE, std::string("Degraded precision: ") + e.what() +
                           "; using logit-normal approximation");
            est.method = IntervalMethod::LogitNormalApproximation;
        }
    }

    est.interval = logitNormalInterval(alpha_post, beta_post, credible_level_);
    est.degraded = true;
    return est;
}

double BetaBinomialEngine::exceedanceProbability(int events, int n, double rate) const {
    validateCounts(events, n, "BetaBinomialEngine::exceedanceProbability");
    if (!(rate > 0.0 && rate < 1.0)) {
        THROW_INVALID_PARAM("BetaBinomialEngine::exceedanceProbability", "rate must lie in (0, 1)");
    }
    return boost::math::ibetac(prior_.alpha() + events, prior_.beta() + (n - events), rate);
}

std::vector<AccrualPoint> BetaBinomialEngine::evidenceAccrual(const std::vector<CumulativeCount>& series,
                                                              int projection_horizon) const {
    if (projection_horizon < 0) {
        THROW_INVALID_PARAM("BetaBinomialEngine::evidenceAccrual", "projection horizon must be non-negative");
    }
    if (series.empty() && projection_horizon > 0) {
        THROW_INVALID_PARAM("BetaBinomialEngine::evidenceAccrual", "cannot project without at least one observed point");
    }

    std::vector<AccrualPoint> points;
    points.reserve(series.size() + 1);

    int prev_events = 0;
    int prev_n = 0;
    for (const auto& c : series) {
        if (c.events < prev_events || c.n < prev_n) {
            THROW_DATA_INCONSISTENCY("BetaBinomialEngine::evidenceAccrual",
                "cumulative counts decrease at timepoint " + std::to_string(c.timepoint.index));
        }
        prev_events = c.events;
        prev_n = c.n;

        const PosteriorEstimate est = posterior(c.events, c.n);
        AccrualPoint p;
        p.timepoint = c.timepoint;
        p.cumulative_events = c.events;
        p.cumulative_n = c.n;
        p.mean = est.mean;
        p.interval = est.interval;
        p.method = est.method;
        p.degraded = est.degraded;
        points.push_back(p);

        logger.debug(LOG_SOURCE, "Accrual t=" + std::to_string(c.timepoint.index) + " n=" + std::to_string(c.n) +
                     " events=" + std::to_string(c.events) + " mean=" + std::to_string(est.mean) +
                     " width=" + std::to_string(est.interval.width()));
    }

    if (projection_horizon > 0) {
        const CumulativeCount& last = series.back();
        const double m = points.back().mean;
        const double expected_new_events = projection_horizon * m;

        const PosteriorEstimate est = posteriorFromParameters(
            prior_.alpha() + last.events + expected_new_events,
            prior_.beta() + (last.n - last.events) + projection_horizon * (1.0 - m),
            IntervalMethod::ExactBetaQuantile);
        const PredictiveDistribution pred = predictive(last.events, last.n, projection_horizon);

        AccrualPoint p;
        p.timepoint = Timepoint{last.timepoint.index + 1, "projection +" + std::to_string(projection_horizon)};
        p.cumulative_events = last.events + expected_new_events;
        p.cumulative_n = last.n + projection_horizon;
        p.mean = est.mean;
        p.interval = est.interval;
        p.method = est.method;
        p.degraded = est.degraded;
        p.is_projected = true;
        p.projected_new_patients = projection_horizon;
        p.predicted_events_low = last.events + pred.interval_low;
        p.predicted_events_high = last.events + pred.interval_high;
        points.push_back(p);
    }
    return points;
}

std::vector<StoppingBoundaryPoint> BetaBinomialEngine::stoppingBoundary(double target_rate,
                                                                        double probability_threshold,
                                                                        int max_n) const {
    if (!(target_rate > 0.0 && target_rate < 1.0)) {
        THROW_INVALID_PARAM("BetaBinomialEngine::stoppingBoundary", "target_rate must lie in (0, 1)");
    }
    if (!(probability_threshold > 0.0 && probability_threshold < 1.0)) {
        THROW_INVALID_PARAM("BetaBinomialEngine::stoppingBoundary", "probability_threshold must lie in (0, 1)");
    }
    if (max_n < 1) {
        THROW_INVALID_PARAM("BetaBinomialEngine::stoppingBoundary", "max_n must be at least 1");
    }

    // P(p > r | k, n) increases with k and decreases with n, so the boundary for n
    // starts from the boundary for n - 1.
    std::vector<StoppingBoundaryPoint> boundary;
    boundary.reserve(static_cast<std::size_t>(max_n));
    int k = -1;
    for (int n = 1; n <= max_n; ++n) {
        while (k + 1 <= n) {
            const double exceed = boost::math::ibetac(prior_.alpha() + (k + 1), prior_.beta() + (n - k - 1), target_rate);
            if (exceed < probability_threshold) {
                ++k;
            } else {
                break;
            }
        }
        boundary.push_back(StoppingBoundaryPoint{n, k});
    }
    return boundary;
}

std::vector<StoppingBoundaryPoint> BetaBinomialEngine::transitionPoints(const std::vector<StoppingBoundaryPoint>& boundary) {
    std::vector<StoppingBoundaryPoint> out;
    for (const auto& p : boundary) {
        if (out.empty() || p.max_tolerable_events != out.back().max_tolerable_events) out.push_back(p);
    }
    return out;
}

PredictiveDistribution BetaBinomialEngine::predictive(int events, int n, int n_new) const {
    validateCounts(events, n, "BetaBinomialEngine::predictive");
    if (n_new < 1) {
        THROW_INVALID_PARAM("BetaBinomialEngine::predictive", "future cohort size must be at least 1");
    }

    const double a = prior_.alpha() + events;
    const double b = prior_.beta() + (n - events);
    const double log_beta_ab = boost::math::lgamma(a) + boost::math::lgamma(b) - boost::math::lgamma(a + b);
    const double log_n_fact = boost::math::lgamma(n_new + 1.0);

    std::vector<double> log_pmf(static_cast<std::size_t>(n_new) + 1);
    double max_log = -std::numeric_limits<double>::infinity();
    for (int k = 0; k <= n_new; ++k) {
        const double log_choose = log_n_fact - boost::math::lgamma(k + 1.0) - boost::math::lgamma(n_new - k + 1.0);
        const double log_beta_post = boost::math::lgamma(k + a) + boost::math::lgamma(n_new - k + b)
                                   - boost::math::lgamma(n_new + a + b);
        log_pmf[static_cast<std::size_t>(k)] = log_choose + log_beta_post - log_beta_ab;
        max_log = std::max(max_log, log_pmf[static_cast<std::size_t>(k)]);
    }
    if (!std::isfinite(max_log)) {
        throw NumericalException("BetaBinomialEngine::predictive", "log PMF evaluation produced no finite values");
    }

    PredictiveDistribution dist;
    dist.n_new = n_new;
    dist.level = credible_level_;
    dist.pmf.resize(log_pmf.size());
    double total = 0.0;
    for (std::size_t k = 0; k < log_pmf.size(); ++k) {
        dist.pmf[k] = std::exp(log_pmf[k] - max_log);
        total += dist.pmf[k];
    }
    for (double& p : dist.pmf) p /= total;

    const double s = a + b;
    dist.mean = n_new * a / s;
    dist.variance = n_new * a * b * (s + n_new) / (s * s * (s + 1.0));

    const double tail = 0.5 * (1.0 - credible_level_);
    double cdf = 0.0;
    bool low_set = false;
    dist.interval_high = n_new;
    for (int k = 0; k <= n_new; ++k) {
        cdf += dist.pmf[static_cast<std::size_t>(k)];
        if (!low_set && cdf >= tail) {
            dist.interval_low = k;
            low_set = true;
        }
        if (cdf >= 1.0 - tail) {
            dist.interval_high = k;
            break;
        }
    }
    return dist;
}

} // namespace ctsafety
