#include "safety/ObservationPooling.hpp"
#include "exceptions/Exceptions.hpp"

#include <algorithm>
#include <map>

namespace ctsafety {

namespace {

struct StudyTimeline {
    std::string product_class;
    std::map<int, const AdverseEventObservation*> by_index;
};

// Study timelines in order of first appearance, validated for monotone cumulative counts.
std::vector<std::pair<std::string, StudyTimeline>> buildTimelines(
    const std::vector<AdverseEventObservation>& observations,
    AdverseEventType type) {

    std::vector<std::pair<std::string, StudyTimeline>> timelines;
    std::map<std::string, std::size_t> index_of;

    for (const auto& obs : observations) {
        if (obs.type() != type) continue;

        auto it = index_of.find(obs.studyId());
        if (it == index_of.end()) {
            it = index_of.emplace(obs.studyId(), timelines.size()).first;
            timelines.emplace_back(obs.studyId(), StudyTimeline{obs.productClass(), {}});
        }
        StudyTimeline& tl = timelines[it->second].second;

        auto [slot, inserted] = tl.by_index.emplace(obs.timepoint().index, &obs);
        if (!inserted && (slot->second->events() != obs.events() || slot->second->n() != obs.n())) {
            THROW_DATA_INCONSISTENCY("latestCountsPerStudy",
                "study '" + obs.studyId() + "' reports conflicting counts at timepoint " +
                std::to_string(obs.timepoint().index));
        }
        if (!obs.productClass().empty()) {
            if (tl.product_class.empty()) {
                tl.product_class = obs.productClass();
            } else if (tl.product_class != obs.productClass()) {
                THROW_DATA_INCONSISTENCY("latestCountsPerStudy",
                    "study '" + obs.studyId() + "' is recorded under two product classes");
            }
        }
    }

    for (const auto& [study, tl] : timelines) {
        int prev_events = 0;
        int prev_n = 0;
        for (const auto& [index, obs] : tl.by_index) {
            if (obs->events() < prev_events || obs->n() < prev_n) {
                THROW_DATA_INCONSISTENCY("latestCountsPerStudy",
                    "cumulative counts for study '" + study + "' decrease at timepoint " + std::to_string(index) +
                    " (" + std::to_string(prev_events) + "/" + std::to_string(prev_n) + " -> " +
                    std::to_string(obs->events()) + "/" + std::to_string(obs->n()) + ")");
            }
            prev_events = obs->events();
            prev_n = obs->n();
        }
    }
    return timelines;
}

} // namespace

std::vector<StudyCounts> latestCountsPerStudy(const std::vector<AdverseEventObservation>& observations,
                                              AdverseEventType type) {
    std::vector<StudyCounts> result;
    for (const auto& [study, tl] : buildTimelines(observations, type)) {
        const AdverseEventObservation* latest = tl.by_index.rbegin()->second;
        result.push_back(StudyCounts{study, tl.product_class, latest->events(), latest->n()});
    }
    return result;
}

PooledCounts poolCounts(const std::vector<StudyCounts>& studies) {
    PooledCounts pooled;
    for (const auto& s : studies) {
        pooled.events += s.events;
        pooled.n += s.n;
        ++pooled.studies;
    }
    return pooled;
}

PooledCounts pooledCountsForType(const std::vector<AdverseEventObservation>& observations,
                                 AdverseEventType type,
                                 const std::string& where) {
    const PooledCounts pooled = poolCounts(latestCountsPerStudy(observations, type));
    if (pooled.studies == 0) {
        THROW_INVALID_PARAM(where, "no observations for adverse event type " + toString(type));
    }
    return pooled;
}

std::vector<CumulativeCount> cumulativeSeries(const std::vector<AdverseEventObservation>& observations,
                                              AdverseEventType type) {
    const auto timelines = buildTimelines(observations, type);

    std::map<int, std::string> labels;
    for (const auto& [study, tl] : timelines) {
        for (const auto& [index, obs] : tl.by_index) {
            auto& label = labels[index];
            if (label.empty()) label = obs->timepoint().label;
        }
    }

    std::vector<CumulativeCount> series;
    for (const auto& [index, label] : labels) {
        CumulativeCount point;
        point.timepoint = Timepoint{index, label};
        for (const auto& [study, tl] : timelines) {
            auto it = tl.by_index.upper_bound(index);
            if (it == tl.by_index.begin()) continue;
            --it;
            point.events += it->second->events();
            point.n += it->second->n();
        }
        series.push_back(point);
    }
    return series;
}

} // namespace ctsafety
