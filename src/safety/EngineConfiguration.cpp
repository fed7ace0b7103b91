#include "safety/EngineConfiguration.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

namespace ctsafety {

static Logger& logger = Logger::getInstance();
static const std::string LOG_SOURCE = "ENGINE_CONFIG";

EngineConfiguration::EngineConfiguration(std::string version,
                                         std::map<AdverseEventType, AdverseEventProfile> profiles,
                                         std::vector<MitigationStrategy> strategies,
                                         CorrelationMatrix correlations,
                                         std::map<std::string, std::string> approval_dates,
                                         std::map<std::string, double> settings)
    : version_(std::move(version)),
      profiles_(std::move(profiles)),
      strategies_(std::move(strategies)),
      correlations_(std::move(correlations)),
      approval_dates_(std::move(approval_dates)),
      settings_(std::move(settings))
{
    if (version_.empty()) {
        THROW_INVALID_PARAM("EngineConfiguration", "configuration version must not be empty");
    }
    for (const auto& [type, profile] : profiles_) {
        if (!(profile.target_rate > 0.0 && profile.target_rate < 1.0)) {
            THROW_INVALID_PARAM("EngineConfiguration",
                "target rate for " + toString(type) + " must lie in (0, 1)");
        }
    }
    for (std::size_t i = 0; i < strategies_.size(); ++i) {
        strategies_[i].validate();
        if (!strategy_index_.emplace(strategies_[i].id, i).second) {
            THROW_INVALID_PARAM("EngineConfiguration", "duplicate mitigation strategy id '" + strategies_[i].id + "'");
        }
    }
    for (const auto& [pair, rho] : correlations_.entries()) {
        if (!hasStrategy(pair.first) || !hasStrategy(pair.second)) {
            THROW_INVALID_PARAM("EngineConfiguration",
                "correlation entry references unknown strategy (" + pair.first + ", " + pair.second + ")");
        }
    }
    const double level = credibleLevel();
    if (!(level > 0.0 && level < 1.0)) {
        THROW_INVALID_PARAM("EngineConfiguration", "credible_level must lie in (0, 1)");
    }
}

const PriorSpecification& EngineConfiguration::prior(AdverseEventType type) const {
    auto it = profiles_.find(type);
    if (it == profiles_.end()) {
        THROW_INVALID_PARAM("EngineConfiguration::prior", "no prior configured for " + toString(type));
    }
    return it->second.prior;
}

double EngineConfiguration::targetRate(AdverseEventType type) const {
    auto it = profiles_.find(type);
    if (it == profiles_.end()) {
        THROW_INVALID_PARAM("EngineConfiguration::targetRate", "no target rate configured for " + toString(type));
    }
    return it->second.target_rate;
}

const MitigationStrategy& EngineConfiguration::strategy(const std::string& id) const {
    auto it = strategy_index_.find(id);
    if (it == strategy_index_.end()) {
        THROW_INVALID_PARAM("EngineConfiguration::strategy", "unknown mitigation strategy '" + id + "'");
    }
    return strategies_[it->second];
}

bool EngineConfiguration::hasStrategy(const std::string& id) const {
    return strategy_index_.count(id) > 0;
}

std::optional<std::string> EngineConfiguration::approvalDate(const std::string& product) const {
    auto it = approval_dates_.find(product);
    if (it == approval_dates_.end()) return std::nullopt;
    return it->second;
}

double EngineConfiguration::setting(const std::string& key, double default_value) const {
    auto it = settings_.find(key);
    return (it != settings_.end()) ? it->second : default_value;
}

double EngineConfiguration::credibleLevel() const {
    return setting("credible_level", 0.95);
}

HeterogeneityPolicy EngineConfiguration::heterogeneityPolicy() const {
    return setting("heterogeneity_reject", 0.0) != 0.0 ? HeterogeneityPolicy::Reject : HeterogeneityPolicy::Annotate;
}

RecentApprovalPolicy EngineConfiguration::recentApprovalPolicy() const {
    return setting("recent_approval_suppress", 0.0) != 0.0 ? RecentApprovalPolicy::Suppress : RecentApprovalPolicy::Annotate;
}

SignalThresholds EngineConfiguration::signalThresholds() const {
    SignalThresholds t;
    t.strong_prr = setting("strong_prr", t.strong_prr);
    t.strong_eb05 = setting("strong_eb05", t.strong_eb05);
    t.moderate_prr = setting("moderate_prr", t.moderate_prr);
    t.weak_prr = setting("weak_prr", t.weak_prr);
    t.weak_eb05 = setting("weak_eb05", t.weak_eb05);
    t.min_cases = static_cast<long long>(setting("min_cases", static_cast<double>(t.min_cases)));
    return t;
}

std::shared_ptr<const EngineConfiguration> EngineConfiguration::withSettings(
    const std::map<std::string, double>& overrides,
    const std::string& new_version) const {

    if (new_version == version_) {
        THROW_INVALID_PARAM("EngineConfiguration::withSettings", "a modified configuration needs a new version");
    }
    std::map<std::string, double> merged = settings_;
    for (const auto& [key, value] : overrides) merged[key] = value;

    logger.info(LOG_SOURCE, "Derived configuration " + new_version + " from " + version_);
    return std::make_shared<const EngineConfiguration>(
        new_version, profiles_, strategies_, correlations_, approval_dates_, std::move(merged));
}

std::shared_ptr<const EngineConfiguration> EngineConfiguration::defaults() {
    std::map<AdverseEventType, AdverseEventProfile> profiles;
    profiles.emplace(AdverseEventType::CRS,
        AdverseEventProfile{PriorSpecification(0.21, 1.29, "Discounted oncology CAR-T grade>=3 CRS ~14%, ESS 1.5"), 0.05});
    profiles.emplace(AdverseEventType::ICANS,
        AdverseEventProfile{PriorSpecification(0.14, 1.03, "Discounted oncology CAR-T grade>=3 ICANS ~12%, ESS 1.17"), 0.05});
    profiles.emplace(AdverseEventType::ICAHS,
        AdverseEventProfile{PriorSpecification(0.5, 0.5, "Jeffreys non-informative"), 0.05});
    profiles.emplace(AdverseEventType::HLH,
        AdverseEventProfile{PriorSpecification(0.5, 0.5, "Jeffreys non-informative"), 0.05});
    profiles.emplace(AdverseEventType::LICATS,
        AdverseEventProfile{PriorSpecification(0.5, 0.5, "Jeffreys non-informative"), 0.05});

    auto make = [](std::string id, std::string name, double rr, double lo, double hi,
                   std::set<AdverseEventType> targets, EvidenceLevel level, std::set<std::string> pathways) {
        MitigationStrategy s;
        s.id = std::move(id);
        s.name = std::move(name);
        s.relative_risk = rr;
        s.ci_low = lo;
        s.ci_high = hi;
        s.target_adverse_events = std::move(targets);
        s.evidence_level = level;
        s.pathways = std::move(pathways);
        return s;
    };

    using AE = AdverseEventType;
    std::vector<MitigationStrategy> strategies = {
        make("tocilizumab", "Prophylactic tocilizumab", 0.45, 0.30, 0.65,
             {AE::CRS}, EvidenceLevel::Strong, {"IL-6"}),
        make("corticosteroids", "Early corticosteroids", 0.55, 0.35, 0.75,
             {AE::ICANS}, EvidenceLevel::Moderate, {"IL-6", "IL-1", "glucocorticoid"}),
        make("anakinra", "Prophylactic anakinra", 0.65, 0.45, 0.85,
             {AE::CRS, AE::ICANS}, EvidenceLevel::Limited, {"IL-1"}),
        make("dose-reduction", "Reduced cell dose", 0.15, 0.08, 0.30,
             {AE::CRS, AE::ICANS, AE::ICAHS}, EvidenceLevel::Strong, {"car-t-expansion"}),
        make("lymphodepletion-modification", "Modified lymphodepletion", 0.85, 0.65, 1.05,
             {AE::CRS}, EvidenceLevel::Limited, {"car-t-expansion"}),
    };

    CorrelationMatrix correlations;
    correlations.set("anakinra", "corticosteroids", 0.3);
    correlations.set("anakinra", "tocilizumab", 0.4);
    correlations.set("corticosteroids", "tocilizumab", 0.5);

    std::map<std::string, std::string> approvals = {
        {"KYMRIAH", "2017-08-30"},
        {"YESCARTA", "2017-10-18"},
        {"BREYANZI", "2021-02-05"},
        {"ABECMA", "2021-03-26"},
        {"CARVYKTI", "2022-02-28"},
        {"TECVAYLI", "2022-10-25"},
    };

    return std::make_shared<const EngineConfiguration>(
        "builtin-1", std::move(profiles), std::move(strategies), std::move(correlations),
        std::move(approvals), std::map<std::string, double>{});
}

} // namespace ctsafety
