#ifndef READ_OBSERVATIONS_HPP
#define READ_OBSERVATIONS_HPP

#include "safety/SafetyTypes.hpp"

#include <string>
#include <vector>

namespace ctsafety {

/**
 * @brief Read cumulative count records from CSV.
 *
 * Header: `study_id,timepoint,label,adverse_event_type,events,n,product_class`
 * (product_class may be empty).
 *
 * @throws DataFormatException on malformed rows, InvalidParameterException on invalid counts.
 */
std::vector<AdverseEventObservation> readObservationsCSV(const std::string& filepath);

/**
 * @brief Read time-to-onset records from CSV.
 *
 * Header: `subject_id,adverse_event_type,time,event_observed` where event_observed is 0 or 1.
 */
std::vector<TimeToEventRecord> readOnsetRecordsCSV(const std::string& filepath);

} // namespace ctsafety

#endif // READ_OBSERVATIONS_HPP
