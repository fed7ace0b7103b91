#ifndef CSV_REPORTING_SOURCE_HPP
#define CSV_REPORTING_SOURCE_HPP

#include "signal/interfaces/IReportingSource.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ctsafety {

/**
 * @brief Reporting database backed by a count snapshot file.
 *
 * Rows are `kind,drug,event,count` after a header line, where kind is one of
 * `pair`, `drug` (event column empty), `event` (drug column empty) or `total`
 * (both empty). Terms are matched case-insensitively. The snapshot is validated
 * on load: a pair count may not exceed its drug or event margin, margins may not
 * exceed the total, and every pair needs both margins.
 *
 * Read-only after construction, so concurrent queries are safe.
 */
class CsvReportingSource : public IReportingSource {
public:
    /// @throws FileIOException, DataFormatException, DataInconsistencyException
    explicit CsvReportingSource(const std::string& filepath);

    std::string name() const override { return "snapshot:" + filepath_; }
    long long countReports(const ReportQuery& query) override;
    std::vector<PairCount> pairTable() override;

    long long totalReports() const { return total_; }

private:
    void validate() const;

    std::string filepath_;
    std::map<std::pair<std::string, std::string>, long long> pairs_;
    std::map<std::string, long long> drug_totals_;
    std::map<std::string, long long> event_totals_;
    long long total_ = -1;
};

} // namespace ctsafety

#endif // CSV_REPORTING_SOURCE_HPP
