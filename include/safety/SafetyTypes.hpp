#ifndef SAFETY_TYPES_HPP
#define SAFETY_TYPES_HPP

#include <map>
#include <set>
#include <string>
#include <vector>

namespace ctsafety {

/**
 * @brief Adverse-event categories tracked by the core.
 *
 * The type is always an explicit field on a record; it is never inferred from free text.
 */
enum class AdverseEventType {
    CRS,
    ICANS,
    HLH,
    ICAHS,
    LICATS
};

std::string toString(AdverseEventType type);

/**
 * @brief Parse an exact (case-insensitive) adverse-event type name.
 * @throws InvalidParameterException for anything that is not one of the enum names.
 */
AdverseEventType parseAdverseEventType(const std::string& text);

const std::vector<AdverseEventType>& allAdverseEventTypes();

enum class EvidenceLevel {
    Strong,
    Moderate,
    Limited
};

std::string toString(EvidenceLevel level);
EvidenceLevel parseEvidenceLevel(const std::string& text);

/**
 * @brief Ordinal position of an observation in a study timeline, with an optional label
 *        such as "Q3 2024" or an ISO date.
 */
struct Timepoint {
    int index = 0;
    std::string label;
};

/**
 * @brief Cumulative count record for one study at one timepoint.
 *
 * Immutable once constructed. The constructor enforces events >= 0, n > 0 and events <= n.
 */
class AdverseEventObservation {
public:
    AdverseEventObservation(AdverseEventType type,
                            int events,
                            int n,
                            std::string study_id,
                            Timepoint timepoint,
                            std::string product_class = "");

    AdverseEventType type() const { return type_; }
    int events() const { return events_; }
    int n() const { return n_; }
    const std::string& studyId() const { return study_id_; }
    const Timepoint& timepoint() const { return timepoint_; }
    const std::string& productClass() const { return product_class_; }

private:
    AdverseEventType type_;
    int events_;
    int n_;
    std::string study_id_;
    Timepoint timepoint_;
    std::string product_class_;
};

/**
 * @brief Beta(alpha, beta) prior for one adverse-event type.
 *
 * Validated on construction; a revised prior is a new object in a new configuration version.
 */
class PriorSpecification {
public:
    PriorSpecification(double alpha, double beta, std::string provenance);

    double alpha() const { return alpha_; }
    double beta() const { return beta_; }
    const std::string& provenance() const { return provenance_; }

    double effectiveSampleSize() const { return alpha_ + beta_; }
    double mean() const { return alpha_ / (alpha_ + beta_); }

private:
    double alpha_;
    double beta_;
    std::string provenance_;
};

/**
 * @brief Time-to-onset record used by the Kaplan-Meier estimator.
 * `event_observed == false` means the subject was censored at `time`.
 */
struct TimeToEventRecord {
    std::string subject_id;
    AdverseEventType type = AdverseEventType::CRS;
    double time = 0.0;
    bool event_observed = false;
};

struct CredibleInterval {
    double lower = 0.0;
    double upper = 0.0;
    double level = 0.95;

    double width() const { return upper - lower; }
};

enum class IntervalMethod {
    ExactBetaQuantile,
    LogitNormalApproximation
};

std::string toString(IntervalMethod method);

/**
 * @brief Derived Beta posterior; recomputed on every query, never stored.
 */
struct PosteriorEstimate {
    double alpha_post = 0.0;
    double beta_post = 0.0;
    double mean = 0.0;
    CredibleInterval interval;
    IntervalMethod method = IntervalMethod::ExactBetaQuantile;
    bool degraded = false;
};

/**
 * @brief Traceability record attached to every estimate.
 *
 * `values` holds numeric by-products (tau^2, I^2, weights, ...); `flags` holds
 * machine-readable markers for approximations, fallbacks and policy decisions.
 */
struct Diagnostics {
    std::map<std::string, double> values;
    std::vector<std::string> flags;
    std::vector<std::string> notes;

    void flag(const std::string& name);
    bool hasFlag(const std::string& name) const;
    void note(const std::string& text) { notes.push_back(text); }
    void merge(const Diagnostics& other);
};

} // namespace ctsafety

#endif // SAFETY_TYPES_HPP
