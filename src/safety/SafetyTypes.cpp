#include "safety/SafetyTypes.hpp"
#include "exceptions/Exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace ctsafety {

namespace {

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

std::string toString(AdverseEventType type) {
    switch (type) {
        case AdverseEventType::CRS:    return "CRS";
        case AdverseEventType::ICANS:  return "ICANS";
        case AdverseEventType::HLH:    return "HLH";
        case AdverseEventType::ICAHS:  return "ICAHS";
        case AdverseEventType::LICATS: return "LICATS";
    }
    return "UNKNOWN";
}

AdverseEventType parseAdverseEventType(const std::string& text) {
    const std::string key = toUpper(text);
    for (AdverseEventType type : allAdverseEventTypes()) {
        if (toString(type) == key) return type;
    }
    THROW_INVALID_PARAM("parseAdverseEventType", "Unknown adverse event type '" + text + "'");
}

const std::vector<AdverseEventType>& allAdverseEventTypes() {
    static const std::vector<AdverseEventType> types = {
        AdverseEventType::CRS, AdverseEventType::ICANS, AdverseEventType::HLH,
        AdverseEventType::ICAHS, AdverseEventType::LICATS};
    return types;
}

std::string toString(EvidenceLevel level) {
    switch (level) {
        case EvidenceLevel::Strong:   return "Strong";
        case EvidenceLevel::Moderate: return "Moderate";
        case EvidenceLevel::Limited:  return "Limited";
    }
    return "Unknown";
}

EvidenceLevel parseEvidenceLevel(const std::string& text) {
    const std::string key = toUpper(text);
    if (key == "STRONG") return EvidenceLevel::Strong;
    if (key == "MODERATE") return EvidenceLevel::Moderate;
    if (key == "LIMITED") return EvidenceLevel::Limited;
    THROW_INVALID_PARAM("parseEvidenceLevel", "Unknown evidence level '" + text + "'");
}

std::string toString(IntervalMethod method) {
    switch (method) {
        case IntervalMethod::ExactBetaQuantile:        return "exact_beta_quantile";
        case IntervalMethod::LogitNormalApproximation: return "logit_normal_approximation";
    }
    return "unknown";
}

AdverseEventObservation::AdverseEventObservation(AdverseEventType type,
                                                 int events,
                                                 int n,
                                                 std::string study_id,
                                                 Timepoint timepoint,
                                                 std::string product_class)
    : type_(type),
      events_(events),
      n_(n),
      study_id_(std::move(study_id)),
      timepoint_(std::move(timepoint)),
      product_class_(std::move(product_class))
{
    if (events_ < 0) {
        THROW_INVALID_PARAM("AdverseEventObservation", "events must be non-negative (got " + std::to_string(events_) + ")");
    }
    if (n_ <= 0) {
        THROW_INVALID_PARAM("AdverseEventObservation", "n must be positive (got " + std::to_string(n_) + ")");
    }
    if (events_ > n_) {
        THROW_INVALID_PARAM("AdverseEventObservation",
            "events (" + std::to_string(events_) + ") cannot exceed n (" + std::to_string(n_) + ")");
    }
}

PriorSpecification::PriorSpecification(double alpha, double beta, std::string provenance)
    : alpha_(alpha), beta_(beta), provenance_(std::move(provenance))
{
    if (!(alpha_ > 0.0) || !std::isfinite(alpha_)) {
        THROW_INVALID_PARAM("PriorSpecification", "alpha must be a positive finite number");
    }
    if (!(beta_ > 0.0) || !std::isfinite(beta_)) {
        THROW_INVALID_PARAM("PriorSpecification", "beta must be a positive finite number");
    }
}

void Diagnostics::flag(const std::string& name) {
    if (!hasFlag(name)) flags.push_back(name);
}

bool Diagnostics::hasFlag(const std::string& name) const {
    return std::find(flags.begin(), flags.end(), name) != flags.end();
}

void Diagnostics::merge(const Diagnostics& other) {
    for (const auto& [key, value] : other.values) values[key] = value;
    for (const auto& f : other.flags) flag(f);
    notes.insert(notes.end(), other.notes.begin(), other.notes.end());
}

} // namespace ctsafety
