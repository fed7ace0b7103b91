#ifndef OBSERVATION_POOLING_HPP
#define OBSERVATION_POOLING_HPP

#include "safety/SafetyTypes.hpp"

#include <string>
#include <vector>

namespace ctsafety {

/**
 * @brief Latest cumulative counts of one study for one adverse-event type.
 */
struct StudyCounts {
    std::string study_id;
    std::string product_class;
    int events = 0;
    int n = 0;
};

struct PooledCounts {
    int events = 0;
    int n = 0;
    int studies = 0;
};

/**
 * @brief Cumulative counts across all studies at one timepoint.
 */
struct CumulativeCount {
    Timepoint timepoint;
    int events = 0;
    int n = 0;
};

/**
 * @brief Reduce observations of `type` to each study's latest cumulative counts.
 *
 * Studies appear in order of first occurrence. Records of other types are ignored.
 *
 * @throws DataInconsistencyException if a study's cumulative events or n decrease over
 *         time, or if one study reports two different counts at the same timepoint.
 */
std::vector<StudyCounts> latestCountsPerStudy(const std::vector<AdverseEventObservation>& observations,
                                              AdverseEventType type);

PooledCounts poolCounts(const std::vector<StudyCounts>& studies);

/**
 * @brief Pooled latest counts for `type`.
 * @throws InvalidParameterException if there are no observations of that type.
 */
PooledCounts pooledCountsForType(const std::vector<AdverseEventObservation>& observations,
                                 AdverseEventType type,
                                 const std::string& where);

/**
 * @brief Build the cross-study cumulative series for `type`, one entry per distinct timepoint.
 *
 * At timepoint t each study contributes its latest record at or before t.
 */
std::vector<CumulativeCount> cumulativeSeries(const std::vector<AdverseEventObservation>& observations,
                                              AdverseEventType type);

} // namespace ctsafety

#endif // OBSERVATION_POOLING_HPP
