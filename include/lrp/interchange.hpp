#pragma once
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <lrp/sample.hpp>

namespace lrp {

// Text table: header "timestamp,key,type,value,meta", one Sample per row.
// Fields holding ',', '"' or a newline are quoted (array values, JSON meta).
void write_interchange_csv(std::ostream& out, const std::vector<Sample>& samples);
bool save_interchange_csv(const std::string& path, const std::vector<Sample>& samples);

// Stream-based reader (test-friendly; no filesystem required).
// Header optional, blank lines skipped. Rows with an unparsable timestamp or
// fewer than four columns are skipped; rows later than max_timestamp_s are
// excluded. Result is stably sorted by timestamp.
std::vector<Sample> interchange_from_csv_stream(std::istream& in,
                                                double max_timestamp_s = kDefaultMaxTimestampS);

// Filesystem wrapper; returns nullopt if the file cannot be opened.
std::optional<std::vector<Sample>> load_interchange_csv(const std::string& path,
                                                        double max_timestamp_s = kDefaultMaxTimestampS);

} // namespace lrp
