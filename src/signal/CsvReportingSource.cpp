#include "signal/CsvReportingSource.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"

#include <algorithm>
#include <cctype>

namespace ctsafety {

namespace {

std::string normalizeTerm(std::string term) {
    std::transform(term.begin(), term.end(), term.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return term;
}

long long parseCount(const std::string& text, const std::string& where, const std::string& context) {
    try {
        std::size_t pos = 0;
        const long long v = std::stoll(text, &pos);
        if (pos != text.size() || v < 0) throw std::invalid_argument(text);
        return v;
    } catch (const std::logic_error&) {
        throw DataFormatException(where, "Invalid report count '" + text + "' in " + context);
    }
}

template <typename Map, typename Key>
void insertUnique(Map& map, const Key& key, long long value, const std::string& where, const std::string& what) {
    if (!map.emplace(key, value).second) {
        throw DataFormatException(where, "Duplicate " + what + " row");
    }
}

} // namespace

CsvReportingSource::CsvReportingSource(const std::string& filepath)
    : filepath_(filepath)
{
    const std::string where = "CsvReportingSource";
    const auto lines = FileUtils::readContentLines(filepath);
    if (lines.empty()) {
        throw DataFormatException(where, "Empty report snapshot: " + filepath);
    }

    for (std::size_t i = 1; i < lines.size(); ++i) {
        const auto f = FileUtils::split(lines[i], ',');
        const std::string context = filepath + " row " + std::to_string(i);
        if (f.size() != 4) {
            throw DataFormatException(where, "Expected 4 columns in " + context);
        }
        const std::string kind = normalizeTerm(f[0]);
        const std::string drug = normalizeTerm(f[1]);
        const std::string event = normalizeTerm(f[2]);
        const long long count = parseCount(f[3], where, context);

        if (kind == "PAIR" && !drug.empty() && !event.empty()) {
            insertUnique(pairs_, std::make_pair(drug, event), count, where, "pair " + drug + "/" + event);
        } else if (kind == "DRUG" && !drug.empty() && event.empty()) {
            insertUnique(drug_totals_, drug, count, where, "drug total " + drug);
        } else if (kind == "EVENT" && drug.empty() && !event.empty()) {
            insertUnique(event_totals_, event, count, where, "event total " + event);
        } else if (kind == "TOTAL" && drug.empty() && event.empty()) {
            if (total_ >= 0) throw DataFormatException(where, "Duplicate total row in " + filepath);
            total_ = count;
        } else {
            throw DataFormatException(where, "Unrecognized row kind '" + f[0] + "' in " + context);
        }
    }
    validate();
    Logger::getInstance().info("CsvReportingSource",
        "Loaded " + std::to_string(pairs_.size()) + " drug-event pairs, N=" + std::to_string(total_) +
        " from " + filepath);
}

void CsvReportingSource::validate() const {
    const std::string where = "CsvReportingSource";
    if (total_ < 0) {
        throw DataFormatException(where, "Snapshot has no total row: " + filepath_);
    }
    for (const auto& d : drug_totals_) {
        if (d.second > total_) THROW_DATA_INCONSISTENCY(where, "Drug total for " + d.first + " exceeds database total");
    }
    for (const auto& e : event_totals_) {
        if (e.second > total_) THROW_DATA_INCONSISTENCY(where, "Event total for " + e.first + " exceeds database total");
    }
    for (const auto& p : pairs_) {
        auto d = drug_totals_.find(p.first.first);
        auto e = event_totals_.find(p.first.second);
        if (d == drug_totals_.end() || e == event_totals_.end()) {
            THROW_DATA_INCONSISTENCY(where, "Pair " + p.first.first + "/" + p.first.second + " has no margin rows");
        }
        if (p.second > d->second || p.second > e->second) {
            THROW_DATA_INCONSISTENCY(where, "Pair count for " + p.first.first + "/" + p.first.second +
                                     " exceeds a margin");
        }
    }
}

long long CsvReportingSource::countReports(const ReportQuery& query) {
    if (query.drug && query.event) {
        auto it = pairs_.find(std::make_pair(normalizeTerm(*query.drug), normalizeTerm(*query.event)));
        return it == pairs_.end() ? 0 : it->second;
    }
    if (query.drug) {
        auto it = drug_totals_.find(normalizeTerm(*query.drug));
        return it == drug_totals_.end() ? 0 : it->second;
    }
    if (query.event) {
        auto it = event_totals_.find(normalizeTerm(*query.event));
        return it == event_totals_.end() ? 0 : it->second;
    }
    return total_;
}

std::vector<PairCount> CsvReportingSource::pairTable() {
    std::vector<PairCount> table;
    table.reserve(pairs_.size());
    for (const auto& p : pairs_) {
        PairCount pc;
        pc.drug = p.first.first;
        pc.event = p.first.second;
        pc.observed = p.second;
        pc.drug_total = drug_totals_.at(pc.drug);
        pc.event_total = event_totals_.at(pc.event);
        table.push_back(std::move(pc));
    }
    return table;
}

} // namespace ctsafety
