#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "exceptions/Exceptions.hpp"
#include "service/SafetyRiskService.hpp"
#include "signal/CsvReportingSource.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include "utils/ReadEngineConfiguration.hpp"
#include "utils/ReadObservations.hpp"

using ctsafety::AdverseEventType;
using ctsafety::CsvReportingSource;
using ctsafety::EngineConfiguration;
using ctsafety::EstimationRequest;
using ctsafety::Logger;
using ctsafety::LogLevel;
using ctsafety::Provenance;
using ctsafety::SafetyRiskService;

namespace {

struct Args {
    std::string command;
    std::string configDir;
    std::string observationsPath;
    std::string onsetsPath;
    std::string reportsPath;

    std::string type = "CRS";
    std::string method = "bayesian_beta_binomial";
    std::vector<std::string> methods;
    double level = 0.95;
    int nNew = 0;
    std::optional<double> timeHorizon;
    std::optional<double> shrinkage;
    bool continuityCorrection = false;

    std::optional<int> horizon;
    int maxN = 50;
    std::optional<double> threshold;
    std::optional<double> targetRate;

    std::vector<std::string> drugs;
    std::vector<std::string> events;
    std::string asOf;
    std::optional<long long> timeoutMs;

    std::vector<std::string> strategies;
    std::optional<unsigned long long> seed;
    std::optional<int> samples;

    int threads = 0; // 0 => leave OpenMP default
    bool verbose = false;
};

void printUsage(const char* programName) {
    std::cout
        << "Usage: " << programName << " <command> [options]\n"
        << "Commands:\n"
        << "  estimate  --observations PATH [--onsets PATH] --type T [--method ID] [--level L] [--n-new N]\n"
        << "            [--time-horizon T] [--shrinkage W] [--continuity-correction]\n"
        << "  compare   --observations PATH [--onsets PATH] --type T [--methods ID,ID,...]\n"
        << "  methods\n"
        << "  accrual   --observations PATH --type T [--horizon N]\n"
        << "  boundary  --type T [--max-n N] [--threshold P] [--target-rate R]\n"
        << "  signal    --reports PATH --drug D [--drug D...] --event E [--event E...] --as-of YYYY-MM-DD\n"
        << "            [--timeout-ms N]\n"
        << "  combine   --strategies ID,ID,... --type T [--observations PATH] [--seed N] [--samples N]\n"
        << "Common options: [--config DIR] [--threads N] [--verbose]\n";
}

Args parseArgs(int argc, char** argv) {
    Args args;
    const std::string root = FileUtils::getProjectRoot();
    args.configDir = FileUtils::joinPaths(root, "data/configuration");

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto requireValue = [&](const char* flag) -> std::string {
            if (i + 1 >= argc) {
                throw std::runtime_error(std::string("Missing value after ") + flag);
            }
            return std::string(argv[++i]);
        };

        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            std::exit(0);
        }
        if (a.rfind("--", 0) != 0) {
            if (!args.command.empty()) throw std::runtime_error("Unexpected argument: " + a);
            args.command = a;
            continue;
        }
        if (a == "--config") { args.configDir = requireValue("--config"); continue; }
        if (a == "--observations") { args.observationsPath = requireValue("--observations"); continue; }
        if (a == "--onsets") { args.onsetsPath = requireValue("--onsets"); continue; }
        if (a == "--reports") { args.reportsPath = requireValue("--reports"); continue; }
        if (a == "--type") { args.type = requireValue("--type"); continue; }
        if (a == "--method") { args.method = requireValue("--method"); continue; }
        if (a == "--methods") { args.methods = FileUtils::split(requireValue("--methods"), ','); continue; }
        if (a == "--level") { args.level = std::stod(requireValue("--level")); continue; }
        if (a == "--n-new") { args.nNew = std::stoi(requireValue("--n-new")); continue; }
        if (a == "--time-horizon") { args.timeHorizon = std::stod(requireValue("--time-horizon")); continue; }
        if (a == "--shrinkage") { args.shrinkage = std::stod(requireValue("--shrinkage")); continue; }
        if (a == "--continuity-correction") { args.continuityCorrection = true; continue; }
        if (a == "--horizon") { args.horizon = std::stoi(requireValue("--horizon")); continue; }
        if (a == "--max-n") { args.maxN = std::stoi(requireValue("--max-n")); continue; }
        if (a == "--threshold") { args.threshold = std::stod(requireValue("--threshold")); continue; }
        if (a == "--target-rate") { args.targetRate = std::stod(requireValue("--target-rate")); continue; }
        if (a == "--drug") { args.drugs.push_back(requireValue("--drug")); continue; }
        if (a == "--event") { args.events.push_back(requireValue("--event")); continue; }
        if (a == "--as-of") { args.asOf = requireValue("--as-of"); continue; }
        if (a == "--timeout-ms") { args.timeoutMs = std::stoll(requireValue("--timeout-ms")); continue; }
        if (a == "--strategies") { args.strategies = FileUtils::split(requireValue("--strategies"), ','); continue; }
        if (a == "--seed") { args.seed = std::stoull(requireValue("--seed")); continue; }
        if (a == "--samples") { args.samples = std::stoi(requireValue("--samples")); continue; }
        if (a == "--threads") { args.threads = std::stoi(requireValue("--threads")); continue; }
        if (a == "--verbose") { args.verbose = true; continue; }

        throw std::runtime_error("Unknown argument: " + a);
    }

    const std::vector<std::string> commands{"estimate", "compare", "methods", "accrual", "boundary", "signal", "combine"};
    bool known = false;
    for (const auto& c : commands) known = known || c == args.command;
    if (!known) {
        throw std::runtime_error(args.command.empty() ? "A command is required" : "Unknown command: " + args.command);
    }
    if ((args.command == "estimate" || args.command == "compare" || args.command == "accrual") &&
        args.observationsPath.empty()) {
        throw std::runtime_error("--observations is required for " + args.command);
    }
    if (args.command == "signal" && (args.reportsPath.empty() || args.drugs.empty() || args.events.empty() ||
                                     args.asOf.empty())) {
        throw std::runtime_error("signal requires --reports, --drug, --event and --as-of");
    }
    if (args.command == "combine" && args.strategies.empty()) {
        throw std::runtime_error("combine requires --strategies");
    }
    return args;
}

std::shared_ptr<const EngineConfiguration> loadConfiguration(const std::string& dir) {
    if (FileUtils::fileExists(FileUtils::joinPaths(dir, "engine_settings.txt"))) {
        return ctsafety::loadEngineConfiguration(dir);
    }
    Logger::getInstance().warning("ctsafety_cli", "No configuration in " + dir + ", using built-in defaults");
    return EngineConfiguration::defaults();
}

void printProvenance(const Provenance& p) {
    std::cout << "  method: " << p.method << "  (configuration " << p.configuration_version << ")\n";
    for (const auto& [key, value] : p.inputs) {
        std::cout << "  input " << key << " = " << value << "\n";
    }
    if (p.approximations.empty()) {
        std::cout << "  approximations: none\n";
    } else {
        std::cout << "  approximations:";
        for (const auto& a : p.approximations) std::cout << " " << a;
        std::cout << "\n";
    }
}

EstimationRequest buildRequest(const Args& args) {
    EstimationRequest request;
    request.observations = ctsafety::readObservationsCSV(args.observationsPath);
    if (!args.onsetsPath.empty()) {
        request.onset_records = ctsafety::readOnsetRecordsCSV(args.onsetsPath);
    }
    request.options.credible_level = args.level;
    request.options.n_new = args.nNew;
    request.options.time_horizon = args.timeHorizon;
    request.options.shrinkage_weight = args.shrinkage;
    request.options.continuity_correction = args.continuityCorrection;
    return request;
}

void printEstimate(const ctsafety::RiskEstimate& e) {
    std::cout << "  point " << e.point << "  interval [" << e.interval.lower << ", " << e.interval.upper
              << "] at " << e.interval.level << "\n";
    for (const auto& [key, value] : e.diagnostics.values) {
        std::cout << "  " << key << " = " << value << "\n";
    }
    for (const auto& n : e.diagnostics.notes) std::cout << "  note: " << n << "\n";
}

} // namespace

int main(int argc, char** argv) {
    Logger::getInstance().setLogLevel(LogLevel::WARNING);

    try {
        const Args args = parseArgs(argc, argv);
        if (args.verbose) Logger::getInstance().setLogLevel(LogLevel::INFO);

#ifdef _OPENMP
        if (args.threads > 0) {
            omp_set_num_threads(args.threads);
        }
#endif

        const auto config = loadConfiguration(args.configDir);
        std::shared_ptr<CsvReportingSource> reports;
        if (!args.reportsPath.empty()) {
            reports = std::make_shared<CsvReportingSource>(args.reportsPath);
        }
        SafetyRiskService service(config, reports);
        const AdverseEventType type = ctsafety::parseAdverseEventType(args.type);
        std::cout << std::setprecision(6);

        if (args.command == "methods") {
            for (const auto& m : service.listMethods()) {
                std::cout << m.id << "\n  " << m.description << "\n  contexts:";
                for (const auto& c : m.suitable_contexts) std::cout << " [" << c << "]";
                std::cout << "\n";
            }
        } else if (args.command == "estimate") {
            const auto r = service.estimateRisk(type, buildRequest(args), args.method);
            std::cout << ctsafety::toString(type) << " risk (" << r.estimate.method_name << ")\n";
            printEstimate(r.estimate);
            printProvenance(r.provenance);
        } else if (args.command == "compare") {
            const auto r = service.compareMethods(type, buildRequest(args), args.methods);
            for (const auto& entry : r.entries) {
                std::cout << entry.method_id << ":";
                if (entry.succeeded) {
                    std::cout << " " << entry.estimate.point << " [" << entry.estimate.interval.lower << ", "
                              << entry.estimate.interval.upper << "]\n";
                } else {
                    std::cout << " failed: " << entry.error << "\n";
                }
            }
            printProvenance(r.provenance);
        } else if (args.command == "accrual") {
            const auto observations = ctsafety::readObservationsCSV(args.observationsPath);
            const auto r = service.evidenceAccrual(type, observations, args.horizon);
            std::cout << std::left << std::setw(18) << "timepoint" << std::setw(10) << "events" << std::setw(8)
                      << "n" << std::setw(12) << "mean" << std::setw(26) << "interval" << "\n";
            for (const auto& p : r.points) {
                std::cout << std::left << std::setw(18) << p.timepoint.label << std::setw(10) << p.cumulative_events
                          << std::setw(8) << p.cumulative_n << std::setw(12) << p.mean << "[" << p.interval.lower
                          << ", " << p.interval.upper << "]" << (p.is_projected ? "  (projected)" : "") << "\n";
            }
            printProvenance(r.provenance);
        } else if (args.command == "boundary") {
            const auto r = service.stoppingBoundary(type, args.maxN, args.threshold, args.targetRate);
            std::cout << "Stop when P(rate > " << r.target_rate << ") >= " << r.probability_threshold << "\n";
            for (const auto& p : r.transitions) {
                std::cout << "  from n=" << p.n << ": max tolerable events " << p.max_tolerable_events << "\n";
            }
            printProvenance(r.provenance);
        } else if (args.command == "signal") {
            std::optional<std::chrono::milliseconds> timeout;
            if (args.timeoutMs) timeout = std::chrono::milliseconds(*args.timeoutMs);
            for (const auto& r : service.detectSignals(args.drugs, args.events, args.asOf, timeout)) {
                const auto& s = r.signal;
                std::cout << s.drug << " / " << s.event << ": ";
                if (!s.available) {
                    std::cout << "UNAVAILABLE (" << s.unavailable_reason << ")\n";
                    continue;
                }
                std::cout << "tier " << ctsafety::toString(s.tier)
                          << (s.suppressed ? " (suppressed, raw " + ctsafety::toString(s.raw_tier) + ")" : "") << "\n"
                          << "  a=" << s.table.a << " b=" << s.table.b << " c=" << s.table.c << " d=" << s.table.d << "\n"
                          << "  PRR " << s.prr.value << " [" << s.prr.lower << ", " << s.prr.upper << "]"
                          << "  ROR " << s.ror.value << " [" << s.ror.lower << ", " << s.ror.upper << "]\n"
                          << "  EBGM " << s.ebgm << "  EB05 " << s.eb05 << "  EB95 " << s.eb95 << "\n";
                printProvenance(r.provenance);
            }
        } else if (args.command == "combine") {
            std::vector<ctsafety::AdverseEventObservation> observations;
            if (!args.observationsPath.empty()) {
                observations = ctsafety::readObservationsCSV(args.observationsPath);
            }
            const auto r = service.combineMitigations(args.strategies, type, observations, args.seed, args.samples);
            const auto& m = r.result;
            std::cout << "Combined RR " << m.combined_rr << " (independent product " << m.naive_product << ")\n"
                      << "  RR 95% interval [" << m.rr_distribution.lower << ", " << m.rr_distribution.upper << "]\n"
                      << "  baseline " << m.baseline.mean << ", mitigated risk " << m.mitigated_risk << " ["
                      << m.risk_distribution.lower << ", " << m.risk_distribution.upper << "]\n";
            for (const auto& c : m.pairwise_detail) {
                std::cout << "  merge " << c.left << " + " << c.right << " rho=" << c.rho << " -> " << c.combined
                          << " (x" << c.correctionFactor() << " vs independence)\n";
            }
            for (const auto& id : m.uncertain_benefit) std::cout << "  uncertain benefit: " << id << "\n";
            for (const auto& id : m.not_applicable) std::cout << "  not applicable: " << id << "\n";
            printProvenance(r.provenance);
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }
}
