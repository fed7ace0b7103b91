#include "utils/ReadObservations.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"

#include <cmath>
#include <fstream>

namespace ctsafety {

namespace {

std::vector<std::vector<std::string>> readCsvRows(const std::string& filepath,
                                                  const std::string& where,
                                                  std::size_t expected_columns) {
    std::ifstream in(filepath);
    if (!in.is_open()) {
        throw FileIOException(where, "Cannot open file: " + filepath);
    }

    std::vector<std::vector<std::string>> rows;
    std::string line;
    bool header = true;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        line = FileUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (header) {
            header = false;
            continue;
        }
        auto fields = FileUtils::split(line, ',');
        if (fields.size() != expected_columns) {
            throw DataFormatException(where, filepath + ":" + std::to_string(line_no) + " expected " +
                                      std::to_string(expected_columns) + " columns, found " +
                                      std::to_string(fields.size()));
        }
        rows.push_back(std::move(fields));
    }
    return rows;
}

int parseInt(const std::string& text, const std::string& where) {
    try {
        size_t pos = 0;
        int v = std::stoi(text, &pos);
        if (pos != text.size()) throw std::invalid_argument(text);
        return v;
    } catch (const std::logic_error&) {
        throw DataFormatException(where, "Invalid integer '" + text + "'");
    }
}

} // namespace

std::vector<AdverseEventObservation> readObservationsCSV(const std::string& filepath) {
    const std::string where = "readObservationsCSV";
    std::vector<AdverseEventObservation> observations;

    for (const auto& f : readCsvRows(filepath, where, 7)) {
        Timepoint tp{parseInt(f[1], where), f[2]};
        observations.emplace_back(parseAdverseEventType(f[3]), parseInt(f[4], where), parseInt(f[5], where),
                                  f[0], tp, f[6]);
    }
    Logger::getInstance().info("ReadObservations",
        "Read " + std::to_string(observations.size()) + " observations from " + filepath);
    return observations;
}

std::vector<TimeToEventRecord> readOnsetRecordsCSV(const std::string& filepath) {
    const std::string where = "readOnsetRecordsCSV";
    std::vector<TimeToEventRecord> records;

    for (const auto& f : readCsvRows(filepath, where, 4)) {
        TimeToEventRecord r;
        r.subject_id = f[0];
        r.type = parseAdverseEventType(f[1]);
        try {
            r.time = std::stod(f[2]);
        } catch (const std::logic_error&) {
            throw DataFormatException(where, "Invalid time '" + f[2] + "' for subject " + f[0]);
        }
        if (!(r.time >= 0.0) || !std::isfinite(r.time)) {
            THROW_INVALID_PARAM(where, "onset time must be a non-negative number for subject " + f[0]);
        }
        const int observed = parseInt(f[3], where);
        if (observed != 0 && observed != 1) {
            throw DataFormatException(where, "event_observed must be 0 or 1 for subject " + f[0]);
        }
        r.event_observed = (observed == 1);
        records.push_back(std::move(r));
    }
    return records;
}

} // namespace ctsafety
