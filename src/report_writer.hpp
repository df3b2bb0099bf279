#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace bili_trends {

nlohmann::json summaryToJson(const RunSummary& summary);
nlohmann::json tableToJson(const AggregateTable& table);

/// {"summary": {...}, "tables": {name: {...}}}
nlohmann::json reportToJson(const Report& report);

/// Quote a CSV field when it contains a comma, quote, CR or LF (RFC 4180).
std::string csvField(const std::string& value);

/// Header plus one row per scored record.
void writeDatasetCsv(const std::vector<ScoredRecord>& records, std::ostream& out);

/// File variants.  Throw std::runtime_error if the file cannot be written.
void writeReportJson(const Report& report, const std::string& path);
void writeDatasetCsv(const std::vector<ScoredRecord>& records, const std::string& path);

} // namespace bili_trends
