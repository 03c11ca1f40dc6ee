#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <lrp/log_codec.hpp>
#include <lrp/sample.hpp>

namespace lrp {

struct ProjectionStats {
  std::size_t records = 0;
  std::size_t control_records = 0;
  std::size_t ignored_control = 0;   // unrecognized or malformed control payloads
  std::size_t orphan_records = 0;    // data for an unknown or finished entry
  std::size_t decode_failures = 0;   // kept with an empty value
  std::size_t out_of_window = 0;     // later than max_timestamp_s
};

// One forward pass: control records drive an EntryRegistry, data records
// become Samples. Output is stably sorted by timestamp.
std::vector<Sample> project_records(const LogReader& reader,
                                    double max_timestamp_s = kDefaultMaxTimestampS,
                                    ProjectionStats* stats = nullptr);

// Read a whole log file and project it; nullopt if it cannot be read.
std::optional<std::vector<Sample>> load_log_file(const std::string& path,
                                                 double max_timestamp_s = kDefaultMaxTimestampS,
                                                 ProjectionStats* stats = nullptr);

std::optional<Bytes> read_file_bytes(const std::string& path);

} // namespace lrp
