#pragma once
#include <string>
#include <vector>
#include <lrp/value.hpp>

namespace lrp {

// Samples later than this are dropped on load; also the seek ceiling.
inline constexpr double kDefaultMaxTimestampS = 1000.0;

// One recorded value change: the interchange tuple.
struct Sample {
  double timestamp_s = 0.0;
  std::string key;
  ValueType type = ValueType::Raw;
  std::string type_name;   // as registered, e.g. "double" or "struct:Pose2d"
  std::string value;       // interchange text encoding
  std::string metadata;

  bool operator==(const Sample&) const = default;
};

// Stable by timestamp; ties keep record order.
void sort_samples(std::vector<Sample>& samples);

} // namespace lrp
