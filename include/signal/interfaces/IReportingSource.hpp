#ifndef IREPORTING_SOURCE_HPP
#define IREPORTING_SOURCE_HPP

#include "signal/SignalTypes.hpp"

#include <string>
#include <vector>

namespace ctsafety {

/**
 * @class IReportingSource
 * @brief Spontaneous-report database that answers count queries.
 *
 * Implementations are called concurrently from the client worker pool and must be
 * thread-safe. A failed query throws ExternalSourceException; a successful query
 * that matches no report returns 0.
 */
class IReportingSource {
public:
    virtual ~IReportingSource() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Number of reports matching the query. A query with neither drug nor
     *        event is the unrestricted database total.
     */
    virtual long long countReports(const ReportQuery& query) = 0;

    /**
     * @brief Observed count and margins of every drug-event pair in the database.
     */
    virtual std::vector<PairCount> pairTable() = 0;
};

} // namespace ctsafety

#endif // IREPORTING_SOURCE_HPP
