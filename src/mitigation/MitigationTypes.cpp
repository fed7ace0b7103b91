#include "mitigation/MitigationTypes.hpp"
#include "exceptions/Exceptions.hpp"

#include <cmath>

namespace ctsafety {

void MitigationStrategy::validate() const {
    const std::string where = "MitigationStrategy[" + id + "]";
    if (id.empty()) {
        THROW_INVALID_PARAM("MitigationStrategy", "strategy id must not be empty");
    }
    if (!(relative_risk > 0.0) || !std::isfinite(relative_risk)) {
        THROW_INVALID_PARAM(where, "relative risk must be positive");
    }
    if (!(ci_low > 0.0)) {
        THROW_INVALID_PARAM(where, "confidence interval lower bound must be positive");
    }
    if (ci_low > relative_risk || relative_risk > ci_high) {
        THROW_INVALID_PARAM(where, "confidence interval must satisfy low <= RR <= high");
    }
    if (target_adverse_events.empty()) {
        THROW_INVALID_PARAM(where, "strategy must target at least one adverse event type");
    }
}

bool MitigationStrategy::sharesPathwayWith(const MitigationStrategy& other) const {
    for (const auto& p : pathways) {
        if (other.pathways.count(p)) return true;
    }
    return false;
}

std::pair<std::string, std::string> CorrelationMatrix::key(const std::string& a, const std::string& b) {
    return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

void CorrelationMatrix::set(const std::string& a, const std::string& b, double rho) {
    if (a == b) {
        THROW_INVALID_PARAM("CorrelationMatrix::set", "self-correlation for '" + a + "' is implicit and cannot be set");
    }
    if (!(rho >= 0.0 && rho <= 1.0)) {
        THROW_INVALID_PARAM("CorrelationMatrix::set",
            "correlation for (" + a + ", " + b + ") must lie in [0, 1], got " + std::to_string(rho));
    }
    const auto k = key(a, b);
    if (!entries_.emplace(k, rho).second) {
        THROW_INVALID_PARAM("CorrelationMatrix::set", "duplicate correlation entry for (" + a + ", " + b + ")");
    }
}

std::optional<double> CorrelationMatrix::find(const std::string& a, const std::string& b) const {
    auto it = entries_.find(key(a, b));
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

double CorrelationMatrix::get(const std::string& a, const std::string& b) const {
    if (a == b) return 1.0;
    return find(a, b).value_or(0.0);
}

Eigen::MatrixXd CorrelationMatrix::toDense(const std::vector<std::string>& ids) const {
    const Eigen::Index m = static_cast<Eigen::Index>(ids.size());
    Eigen::MatrixXd rho(m, m);
    for (Eigen::Index i = 0; i < m; ++i) {
        for (Eigen::Index j = 0; j < m; ++j) {
            rho(i, j) = get(ids[static_cast<size_t>(i)], ids[static_cast<size_t>(j)]);
        }
    }
    return rho;
}

} // namespace ctsafety
