#include "registry/KaplanMeierEstimator.hpp"
#include "exceptions/Exceptions.hpp"

#include <boost/math/distributions/normal.hpp>

#include <algorithm>
#include <cmath>

namespace ctsafety {

std::string KaplanMeierEstimator::description() const {
    return "Kaplan-Meier cumulative incidence of onset with Greenwood log(-log) interval";
}

std::vector<std::string> KaplanMeierEstimator::suitableContexts() const {
    return {"time-to-onset analysis", "censored follow-up", "onset window characterization"};
}

double KaplanMeierCurve::survivalAt(double t) const {
    double s = 1.0;
    for (const auto& step : steps) {
        if (step.time > t) break;
        s = step.survival;
    }
    return s;
}

KaplanMeierCurve KaplanMeierEstimator::fit(const std::vector<TimeToEventRecord>& records, AdverseEventType type) {
    std::vector<const TimeToEventRecord*> subset;
    for (const auto& r : records) {
        if (r.type != type) continue;
        if (!(r.time >= 0.0) || !std::isfinite(r.time)) {
            THROW_INVALID_PARAM("KaplanMeierEstimator::fit", "onset time must be non-negative for subject " + r.subject_id);
        }
        subset.push_back(&r);
    }
    std::sort(subset.begin(), subset.end(),
              [](const TimeToEventRecord* a, const TimeToEventRecord* b) { return a->time < b->time; });

    KaplanMeierCurve curve;
    curve.subjects = static_cast<int>(subset.size());

    int at_risk = curve.subjects;
    double survival = 1.0;
    double greenwood = 0.0;
    std::size_t i = 0;
    while (i < subset.size()) {
        const double t = subset[i]->time;
        int d = 0;
        int c = 0;
        for (; i < subset.size() && subset[i]->time == t; ++i) {
            if (subset[i]->event_observed) ++d; else ++c;
        }

        KaplanMeierStep step;
        step.time = t;
        step.at_risk = at_risk;
        step.events = d;
        step.censored = c;
        if (d > 0) {
            survival *= 1.0 - static_cast<double>(d) / at_risk;
            if (at_risk > d) {
                greenwood += static_cast<double>(d) / (static_cast<double>(at_risk) * (at_risk - d));
            }
            if (!curve.median_time && survival <= 0.5) {
                curve.median_time = t;
            }
        }
        step.survival = survival;
        step.greenwood_sum = greenwood;
        curve.steps.push_back(step);

        curve.total_events += d;
        at_risk -= d + c;
    }
    return curve;
}

RiskEstimate KaplanMeierEstimator::estimate(const EstimationRequest& request, AdverseEventType type) const {
    const std::string where = "KaplanMeierEstimator::estimate";
    const KaplanMeierCurve curve = fit(request.onset_records, type);
    if (curve.subjects == 0) {
        THROW_INVALID_PARAM(where, "no time-to-onset records for adverse event type " + toString(type));
    }

    const double level = request.options.credible_level;
    const double horizon = request.options.time_horizon.value_or(curve.steps.back().time);
    if (!(horizon >= 0.0)) {
        THROW_INVALID_PARAM(where, "time horizon must be non-negative");
    }

    // Last step at or before the horizon.
    const KaplanMeierStep* at = nullptr;
    for (const auto& step : curve.steps) {
        if (step.time > horizon) break;
        at = &step;
    }
    const double survival = at ? at->survival : 1.0;
    const double greenwood = at ? at->greenwood_sum : 0.0;

    RiskEstimate result;
    result.method_name = methodId();
    result.point = 1.0 - survival;
    result.interval.level = level;

    Diagnostics& diag = result.diagnostics;
    diag.values["subjects"] = curve.subjects;
    diag.values["events"] = curve.total_events;
    diag.values["time_horizon"] = horizon;
    diag.values["survival"] = survival;
    if (curve.median_time) {
        diag.values["median_time_to_onset"] = *curve.median_time;
    } else {
        diag.flag("median_not_reached");
    }

    const double z = boost::math::quantile(boost::math::normal_distribution<double>(0.0, 1.0), 0.5 * (1.0 + level));

    if (survival >= 1.0) {
        // No events by the horizon: exact one-sided bound on the initial risk set.
        diag.flag("zero_event_exact_bound");
        result.interval.lower = 0.0;
        result.interval.upper = 1.0 - std::pow(0.5 * (1.0 - level), 1.0 / curve.subjects);
    } else if (survival <= 0.0) {
        diag.flag("all_subjects_had_onset");
        result.interval.lower = 1.0;
        result.interval.upper = 1.0;
    } else {
        const double log_s = std::log(survival);
        const double se = std::sqrt(greenwood) / std::abs(log_s);
        const double theta = std::log(-log_s);
        const double s_low = std::exp(-std::exp(theta + z * se));
        const double s_high = std::exp(-std::exp(theta - z * se));
        result.interval.lower = 1.0 - s_high;
        result.interval.upper = 1.0 - s_low;
        diag.values["greenwood_variance"] = survival * survival * greenwood;
    }
    return result;
}

} // namespace ctsafety
