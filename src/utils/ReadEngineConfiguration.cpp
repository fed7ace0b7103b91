#include "utils/ReadEngineConfiguration.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"

#include <cstdint>
#include <iomanip>
#include <sstream>

namespace ctsafety {

static Logger& logger = Logger::getInstance();
static const std::string LOG_SOURCE = "CONFIG_READER";

namespace {

double parseNumber(const std::string& text, const std::string& where, const std::string& context) {
    try {
        size_t pos = 0;
        double v = std::stod(text, &pos);
        if (pos != text.size()) throw std::invalid_argument(text);
        return v;
    } catch (const std::logic_error&) {
        throw DataFormatException(where, "Invalid number '" + text + "' in " + context);
    }
}

std::set<std::string> splitTags(const std::string& text) {
    std::set<std::string> tags;
    if (text.empty()) return tags;
    for (const auto& part : FileUtils::split(text, ',')) {
        if (!part.empty()) tags.insert(part);
    }
    return tags;
}

// FNV-1a over the raw configuration lines.
void hashLines(std::uint64_t& h, const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        for (unsigned char c : line) {
            h ^= c;
            h *= 1099511628211ULL;
        }
        h ^= '\n';
        h *= 1099511628211ULL;
    }
}

} // namespace

std::map<std::string, double> readEngineSettings(const std::string& filepath) {
    const std::string where = "readEngineSettings";
    std::map<std::string, double> settings;

    for (const auto& line : FileUtils::readContentLines(filepath)) {
        std::istringstream iss(line);
        std::string key, value, extra;
        if (!(iss >> key >> value) || (iss >> extra)) {
            throw DataFormatException(where, "Expected 'key value' in " + filepath + ": " + line);
        }
        const double v = parseNumber(value, where, filepath);
        if (!settings.emplace(key, v).second) {
            throw DataFormatException(where, "Duplicate setting '" + key + "' in " + filepath);
        }
    }
    logger.info(LOG_SOURCE, "Loaded " + std::to_string(settings.size()) + " settings from " + filepath);
    return settings;
}

std::map<AdverseEventType, AdverseEventProfile> readAdverseEventProfiles(const std::string& filepath) {
    const std::string where = "readAdverseEventProfiles";
    std::map<AdverseEventType, AdverseEventProfile> profiles;

    for (const auto& line : FileUtils::readContentLines(filepath)) {
        std::istringstream iss(line);
        std::string type_text, alpha_text, beta_text, rate_text;
        if (!(iss >> type_text >> alpha_text >> beta_text >> rate_text)) {
            throw DataFormatException(where, "Expected 'TYPE alpha beta target_rate provenance' in " + filepath + ": " + line);
        }
        std::string provenance;
        std::getline(iss, provenance);
        provenance = FileUtils::trim(provenance);

        const AdverseEventType type = parseAdverseEventType(type_text);
        PriorSpecification prior(parseNumber(alpha_text, where, filepath),
                                 parseNumber(beta_text, where, filepath),
                                 provenance);
        const double target_rate = parseNumber(rate_text, where, filepath);

        if (!profiles.emplace(type, AdverseEventProfile{prior, target_rate}).second) {
            throw DataFormatException(where, "Duplicate prior for " + type_text + " in " + filepath);
        }
    }
    return profiles;
}

std::vector<MitigationStrategy> readMitigationStrategies(const std::string& filepath) {
    const std::string where = "readMitigationStrategies";
    std::vector<MitigationStrategy> strategies;
    std::set<std::string> seen;

    for (const auto& line : FileUtils::readContentLines(filepath)) {
        const auto fields = FileUtils::split(line, '|');
        if (fields.size() != 8) {
            throw DataFormatException(where, "Expected 8 '|'-separated fields in " + filepath + ": " + line);
        }
        MitigationStrategy s;
        s.id = fields[0];
        s.name = fields[1];
        s.relative_risk = parseNumber(fields[2], where, filepath);
        s.ci_low = parseNumber(fields[3], where, filepath);
        s.ci_high = parseNumber(fields[4], where, filepath);
        for (const auto& t : splitTags(fields[5])) {
            s.target_adverse_events.insert(parseAdverseEventType(t));
        }
        s.evidence_level = parseEvidenceLevel(fields[6]);
        s.pathways = splitTags(fields[7]);
        s.validate();

        if (!seen.insert(s.id).second) {
            throw DataFormatException(where, "Duplicate strategy id '" + s.id + "' in " + filepath);
        }
        strategies.push_back(std::move(s));
    }
    return strategies;
}

CorrelationMatrix readCorrelationMatrix(const std::string& filepath) {
    const std::string where = "readCorrelationMatrix";
    CorrelationMatrix matrix;

    for (const auto& line : FileUtils::readContentLines(filepath)) {
        std::istringstream iss(line);
        std::string a, b, rho_text, extra;
        if (!(iss >> a >> b >> rho_text) || (iss >> extra)) {
            throw DataFormatException(where, "Expected 'strategy_a strategy_b rho' in " + filepath + ": " + line);
        }
        if (matrix.contains(a, b)) {
            throw DataFormatException(where, "Duplicate correlation (" + a + ", " + b + ") in " + filepath);
        }
        matrix.set(a, b, parseNumber(rho_text, where, filepath));
    }
    return matrix;
}

std::map<std::string, std::string> readProductApprovals(const std::string& filepath) {
    const std::string where = "readProductApprovals";
    std::map<std::string, std::string> approvals;

    for (const auto& line : FileUtils::readContentLines(filepath)) {
        std::istringstream iss(line);
        std::string product, date, extra;
        if (!(iss >> product >> date) || (iss >> extra) || date.size() != 10 || date[4] != '-' || date[7] != '-') {
            throw DataFormatException(where, "Expected 'PRODUCT YYYY-MM-DD' in " + filepath + ": " + line);
        }
        if (!approvals.emplace(product, date).second) {
            throw DataFormatException(where, "Duplicate approval date for '" + product + "' in " + filepath);
        }
    }
    return approvals;
}

std::shared_ptr<const EngineConfiguration> loadEngineConfiguration(const std::string& config_dir) {
    const std::string settings_path = FileUtils::joinPaths(config_dir, "engine_settings.txt");
    const std::string priors_path = FileUtils::joinPaths(config_dir, "priors.txt");
    const std::string strategies_path = FileUtils::joinPaths(config_dir, "mitigations.txt");
    const std::string correlations_path = FileUtils::joinPaths(config_dir, "mitigation_correlations.txt");
    const std::string approvals_path = FileUtils::joinPaths(config_dir, "product_approvals.txt");

    std::uint64_t h = 1469598103934665603ULL;
    for (const auto& path : {settings_path, priors_path, strategies_path, correlations_path, approvals_path}) {
        hashLines(h, FileUtils::readContentLines(path));
    }
    std::ostringstream version;
    version << "cfg-" << std::hex << std::setw(16) << std::setfill('0') << h;

    auto config = std::make_shared<const EngineConfiguration>(
        version.str(),
        readAdverseEventProfiles(priors_path),
        readMitigationStrategies(strategies_path),
        readCorrelationMatrix(correlations_path),
        readProductApprovals(approvals_path),
        readEngineSettings(settings_path));

    logger.info(LOG_SOURCE, "Engine configuration " + config->version() + " loaded from " + config_dir);
    return config;
}

} // namespace ctsafety
