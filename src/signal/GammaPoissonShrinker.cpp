#include "signal/GammaPoissonShrinker.hpp"
#include "exceptions/Exceptions.hpp"
#include "optimizers/BoxParameterManager.hpp"
#include "optimizers/HillClimbingOptimizer.hpp"
#include "utils/Logger.hpp"

#include <boost/math/distributions/gamma.hpp>
#include <boost/math/special_functions/digamma.hpp>
#include <boost/math/special_functions/gamma.hpp>
#include <boost/math/tools/roots.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace ctsafety {

static Logger& logger = Logger::getInstance();
static const std::string LOG_SOURCE = "MGPS";

namespace {

double logSumExp(double x, double y) {
    const double m = std::max(x, y);
    if (!std::isfinite(m)) return m;
    return m + std::log(std::exp(x - m) + std::exp(y - m));
}

double logistic(double x) {
    return 1.0 / (1.0 + std::exp(-x));
}

} // namespace

void MixturePrior::validate() const {
    if (!(alpha1 > 0.0 && beta1 > 0.0 && alpha2 > 0.0 && beta2 > 0.0)) {
        THROW_INVALID_PARAM("MixturePrior", "Gamma shape and rate parameters must be positive");
    }
    if (!(p > 0.0 && p < 1.0)) {
        THROW_INVALID_PARAM("MixturePrior", "mixing weight must lie in (0, 1)");
    }
}

// --- MgpsObjectiveFunction ---

MgpsObjectiveFunction::MgpsObjectiveFunction(std::vector<PairObservation> pairs)
    : pairs_(std::move(pairs)), names_{"log_alpha1", "log_beta1", "log_alpha2", "log_beta2", "logit_p"}
{
    if (pairs_.empty()) {
        THROW_INVALID_PARAM("MgpsObjectiveFunction", "at least one drug-event pair is required");
    }
}

Eigen::VectorXd MgpsObjectiveFunction::toUnconstrained(const MixturePrior& prior) {
    Eigen::VectorXd theta(5);
    theta << std::log(prior.alpha1), std::log(prior.beta1), std::log(prior.alpha2), std::log(prior.beta2),
             std::log(prior.p / (1.0 - prior.p));
    return theta;
}

MixturePrior MgpsObjectiveFunction::fromUnconstrained(const Eigen::VectorXd& theta) {
    MixturePrior prior;
    prior.alpha1 = std::exp(theta(0));
    prior.beta1 = std::exp(theta(1));
    prior.alpha2 = std::exp(theta(2));
    prior.beta2 = std::exp(theta(3));
    prior.p = logistic(theta(4));
    return prior;
}

double MgpsObjectiveFunction::calculate(const Eigen::VectorXd& parameters) const {
    const MixturePrior prior = fromUnconstrained(parameters);
    if (!(prior.p > 0.0 && prior.p < 1.0)) {
        return -std::numeric_limits<double>::infinity();
    }
    double total = 0.0;
    for (const auto& pair : pairs_) {
        total += GammaPoissonShrinker::logMarginal(pair.observed, pair.expected, prior);
    }
    return total;
}

// --- GammaPoissonShrinker ---

GammaPoissonShrinker::GammaPoissonShrinker(MixturePrior prior)
    : prior_(prior)
{
    prior_.validate();
}

double GammaPoissonShrinker::logNegativeBinomial(long long n, double expected, double alpha, double beta) {
    const double nn = static_cast<double>(n);
    return boost::math::lgamma(alpha + nn) - boost::math::lgamma(alpha) - boost::math::lgamma(nn + 1.0)
         - alpha * std::log1p(expected / beta)
         - nn * std::log1p(beta / expected);
}

double GammaPoissonShrinker::logMarginal(long long n, double expected, const MixturePrior& prior) {
    return logSumExp(std::log(prior.p) + logNegativeBinomial(n, expected, prior.alpha1, prior.beta1),
                     std::log1p(-prior.p) + logNegativeBinomial(n, expected, prior.alpha2, prior.beta2));
}

double GammaPoissonShrinker::mixtureCdf(double x, double w1, double shape1, double rate1, double shape2, double rate2) {
    if (x <= 0.0) return 0.0;
    const boost::math::gamma_distribution<double> g1(shape1, 1.0 / rate1);
    const boost::math::gamma_distribution<double> g2(shape2, 1.0 / rate2);
    return w1 * boost::math::cdf(g1, x) + (1.0 - w1) * boost::math::cdf(g2, x);
}

double GammaPoissonShrinker::mixtureQuantile(double prob, double w1, double shape1, double rate1, double shape2, double rate2) {
    if (!(prob > 0.0 && prob < 1.0)) {
        THROW_INVALID_PARAM("GammaPoissonShrinker::mixtureQuantile", "probability must lie in (0, 1)");
    }
    const boost::math::gamma_distribution<double> g1(shape1, 1.0 / rate1);
    const boost::math::gamma_distribution<double> g2(shape2, 1.0 / rate2);
    const double q1 = boost::math::quantile(g1, prob);
    const double q2 = boost::math::quantile(g2, prob);
    if (w1 >= 1.0) return q1;
    if (w1 <= 0.0) return q2;

    const double lo = std::min(q1, q2);
    const double hi = std::max(q1, q2);
    auto f = [&](double x) { return mixtureCdf(x, w1, shape1, rate1, shape2, rate2) - prob; };

    const double f_lo = f(lo);
    const double f_hi = f(hi);
    if (f_lo >= 0.0) return lo;
    if (f_hi <= 0.0) return hi;

    std::uintmax_t max_iter = 200;
    const auto bracket = boost::math::tools::toms748_solve(f, lo, hi, f_lo, f_hi,
                                                           boost::math::tools::eps_tolerance<double>(48), max_iter);
    if (max_iter >= 200) {
        throw NumericalException("GammaPoissonShrinker::mixtureQuantile", "root finding did not converge");
    }
    return 0.5 * (bracket.first + bracket.second);
}

EbgmResult GammaPoissonShrinker::evaluate(long long observed, double expected) const {
    if (observed < 0) {
        THROW_INVALID_PARAM("GammaPoissonShrinker::evaluate", "observed count must be non-negative");
    }
    if (!(expected > 0.0) || !std::isfinite(expected)) {
        THROW_INVALID_PARAM("GammaPoissonShrinker::evaluate", "expected count must be positive");
    }

    const double n = static_cast<double>(observed);
    const double l1 = std::log(prior_.p) + logNegativeBinomial(observed, expected, prior_.alpha1, prior_.beta1);
    const double l2 = std::log1p(-prior_.p) + logNegativeBinomial(observed, expected, prior_.alpha2, prior_.beta2);
    const double w1 = std::exp(l1 - logSumExp(l1, l2));

    const double shape1 = prior_.alpha1 + n;
    const double rate1 = prior_.beta1 + expected;
    const double shape2 = prior_.alpha2 + n;
    const double rate2 = prior_.beta2 + expected;

    const double e_log_lambda = w1 * (boost::math::digamma(shape1) - std::log(rate1))
                              + (1.0 - w1) * (boost::math::digamma(shape2) - std::log(rate2));

    EbgmResult r;
    r.observed = observed;
    r.expected = expected;
    r.posterior_weight1 = w1;
    r.ebgm = std::exp(e_log_lambda);
    r.eb05 = mixtureQuantile(0.05, w1, shape1, rate1, shape2, rate2);
    r.eb95 = mixtureQuantile(0.95, w1, shape1, rate1, shape2, rate2);
    return r;
}

MgpsFit GammaPoissonShrinker::fit(const std::vector<PairObservation>& pairs,
                                  const std::map<std::string, double>& optimizer_settings,
                                  int min_pairs) {
    std::vector<PairObservation> usable;
    usable.reserve(pairs.size());
    for (const auto& p : pairs) {
        if (p.observed >= 0 && p.expected > 0.0 && std::isfinite(p.expected)) usable.push_back(p);
    }

    MgpsFit fit;
    fit.pairs = static_cast<int>(usable.size());
    if (fit.pairs < std::max(1, min_pairs)) {
        fit.prior = MixturePrior::dumouchelDefault();
        fit.used_default = true;
        fit.reason = "only " + std::to_string(fit.pairs) + " usable pairs (minimum " + std::to_string(min_pairs) + ")";
        logger.warning(LOG_SOURCE, "Using default mixture prior: " + fit.reason);
        return fit;
    }

    MgpsObjectiveFunction objective(usable);
    const double bound = std::log(1000.0);
    Eigen::VectorXd lower(5), upper(5), sigmas(5);
    lower << -bound, -bound, -bound, -bound, -6.0;
    upper << bound, bound, bound, bound, 6.0;
    sigmas.setConstant(0.3);
    BoxParameterManager space(objective.getParameterNames(), lower, upper, sigmas);

    HillClimbingOptimizer optimizer;
    optimizer.configure(optimizer_settings);
    const Eigen::VectorXd start = MgpsObjectiveFunction::toUnconstrained(MixturePrior::dumouchelDefault());
    const OptimizationResult opt = optimizer.optimize(start, objective, space);

    fit.prior = MgpsObjectiveFunction::fromUnconstrained(opt.bestParameters);
    fit.log_likelihood = opt.bestObjectiveValue;
    fit.iterations = opt.iterations;

    logger.info(LOG_SOURCE, "Fitted mixture prior over " + std::to_string(fit.pairs) + " pairs: a1=" +
                std::to_string(fit.prior.alpha1) + " b1=" + std::to_string(fit.prior.beta1) +
                " a2=" + std::to_string(fit.prior.alpha2) + " b2=" + std::to_string(fit.prior.beta2) +
                " p=" + std::to_string(fit.prior.p) + " logL=" + std::to_string(fit.log_likelihood));
    return fit;
}

} // namespace ctsafety
