#ifndef SIGNAL_DETECTOR_HPP
#define SIGNAL_DETECTOR_HPP

#include "safety/EngineConfiguration.hpp"
#include "signal/GammaPoissonShrinker.hpp"
#include "signal/ReportingSourceClient.hpp"
#include "signal/SignalTypes.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ctsafety {

/**
 * @brief Disproportionality analysis of drug-event pairs against an external report database.
 *
 * For each pair the four margins (pair count, drug total, event total and the filter-free
 * database total) are fetched through the client under one caller deadline. PRR and ROR
 * come from the derived 2x2 table; EBGM and EB05 come from an MGPS prior fitted to the
 * whole pair table of the database (refitted only when that table changes). Any margin
 * that cannot be fetched makes the result unavailable rather than a zero signal.
 *
 * When the product was approved within "recent_approval_window_days" of `as_of`, the
 * result is flagged and, under the suppress policy, its tier is dropped to None while
 * `raw_tier` keeps the computed value. An `as_of` date before the approval is flagged
 * "as_of_before_approval" and never counts as a recent approval.
 */
class SignalDetector {
public:
    using Timeout = ReportingSourceClient::Timeout;

    SignalDetector(std::shared_ptr<const EngineConfiguration> config,
                   std::shared_ptr<ReportingSourceClient> client);

    /**
     * @param as_of   ISO date (YYYY-MM-DD) the analysis refers to.
     * @param timeout Budget for the whole call, margins and pair table together; defaults to
     *                the client's query timeout.
     * @throws InvalidParameterException for empty terms or a malformed date.
     * @throws DataInconsistencyException if the margins imply a negative cell.
     */
    SignalResult detect(const std::string& drug,
                        const std::string& event,
                        const std::string& as_of,
                        std::optional<Timeout> timeout = std::nullopt);

    /**
     * @brief Every drug x event combination, detected signals first, then PRR descending.
     *        Unavailable results sort last.
     */
    std::vector<SignalResult> detectBatch(const std::vector<std::string>& drugs,
                                          const std::vector<std::string>& events,
                                          const std::string& as_of,
                                          std::optional<Timeout> timeout = std::nullopt);

    /// Fitted prior currently in use, if a fit has happened.
    std::optional<MgpsFit> currentFit() const;

    /// @throws InvalidParameterException unless `iso` is a valid YYYY-MM-DD date.
    static std::chrono::sys_days parseIsoDate(const std::string& iso);

    /// Whole days from `from` to `to` (negative when `to` is earlier).
    static int daysBetween(const std::string& from, const std::string& to);

private:
    MgpsFit priorFor(long long n_total, Diagnostics& diagnostics, Timeout remaining);

    std::shared_ptr<const EngineConfiguration> config_;
    std::shared_ptr<ReportingSourceClient> client_;

    mutable std::mutex fit_mutex_;
    std::optional<MgpsFit> fit_;
    std::uint64_t fit_fingerprint_ = 0;
};

} // namespace ctsafety

#endif // SIGNAL_DETECTOR_HPP
