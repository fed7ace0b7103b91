#include "signal/SignalTypes.hpp"
#include "exceptions/Exceptions.hpp"

namespace ctsafety {

double ContingencyTable::expectedA() const {
    const double n = static_cast<double>(total());
    if (n <= 0.0) return 0.0;
    return static_cast<double>(a + b) * static_cast<double>(a + c) / n;
}

ContingencyTable ContingencyTable::fromMargins(long long a, long long drug_total, long long event_total, long long n_total) {
    ContingencyTable t;
    t.a = a;
    t.b = drug_total - a;
    t.c = event_total - a;
    t.d = n_total - a - t.b - t.c;
    if (a < 0 || t.b < 0 || t.c < 0 || t.d < 0) {
        THROW_DATA_INCONSISTENCY("ContingencyTable::fromMargins",
            "negative cell from margins a=" + std::to_string(a) + ", drug=" + std::to_string(drug_total) +
            ", event=" + std::to_string(event_total) + ", N=" + std::to_string(n_total));
    }
    return t;
}

std::string toString(SignalTier tier) {
    switch (tier) {
        case SignalTier::None:     return "none";
        case SignalTier::Weak:     return "weak";
        case SignalTier::Moderate: return "moderate";
        case SignalTier::Strong:   return "strong";
    }
    return "unknown";
}

std::string toString(QueryStatus status) {
    switch (status) {
        case QueryStatus::Ok:          return "ok";
        case QueryStatus::TimedOut:    return "timed_out";
        case QueryStatus::RateLimited: return "rate_limited";
        case QueryStatus::Failed:      return "failed";
    }
    return "unknown";
}

std::string ReportQuery::key() const {
    return "drug=" + drug.value_or("*") + "|event=" + event.value_or("*");
}

} // namespace ctsafety
