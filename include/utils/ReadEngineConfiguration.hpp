#ifndef READ_ENGINE_CONFIGURATION_HPP
#define READ_ENGINE_CONFIGURATION_HPP

#include "safety/EngineConfiguration.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ctsafety {

/**
 * @brief Read "key value" numeric settings.
 * @throws DataFormatException on malformed lines or duplicate keys.
 */
std::map<std::string, double> readEngineSettings(const std::string& filepath);

/**
 * @brief Read per-type priors, one line each: `TYPE alpha beta target_rate provenance...`
 */
std::map<AdverseEventType, AdverseEventProfile> readAdverseEventProfiles(const std::string& filepath);

/**
 * @brief Read the mitigation catalogue, one '|'-separated record per line:
 *        `id|name|rr|ci_low|ci_high|TYPE,TYPE|evidence_level|pathway,pathway`
 */
std::vector<MitigationStrategy> readMitigationStrategies(const std::string& filepath);

/**
 * @brief Read "strategy_a strategy_b rho" lines.
 */
CorrelationMatrix readCorrelationMatrix(const std::string& filepath);

/**
 * @brief Read "PRODUCT YYYY-MM-DD" lines.
 */
std::map<std::string, std::string> readProductApprovals(const std::string& filepath);

/**
 * @brief Load every configuration file from a directory into a versioned configuration.
 *
 * The version is derived from the file contents, so identical inputs always yield the
 * same version string and any edit yields a new one.
 */
std::shared_ptr<const EngineConfiguration> loadEngineConfiguration(const std::string& config_dir);

} // namespace ctsafety

#endif // READ_ENGINE_CONFIGURATION_HPP
