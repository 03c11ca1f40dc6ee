#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <lrp/sample.hpp>

namespace lrp {

inline constexpr double kDefaultPeriodS = 0.020;

struct FrameValue {
  ValueType type = ValueType::Raw;
  std::string type_name;
  std::string value;
  std::string metadata;

  bool operator==(const FrameValue&) const = default;
};

// Last value per key inside [i*period, (i+1)*period).
using Frame = std::map<std::string, FrameValue>;
using FrameArray = std::vector<Frame>;

// Frame slot of a timestamp.
std::size_t frame_index(double timestamp_s, double period_s);

// Bucket a timestamp-sorted sample list into floor(last/period)+1 frames,
// later samples overwriting earlier ones for the same key and slot.
// Zero samples give an empty array.
FrameArray coalesce_frames(const std::vector<Sample>& samples, double period_s = kDefaultPeriodS);

} // namespace lrp
