#include <lrp/frames.hpp>
#include <cmath>

namespace lrp {

std::size_t frame_index(double timestamp_s, double period_s) {
  if (!(timestamp_s > 0.0) || !(period_s > 0.0)) return 0;
  return static_cast<std::size_t>(std::floor(timestamp_s / period_s));
}

FrameArray coalesce_frames(const std::vector<Sample>& samples, double period_s) {
  FrameArray frames;
  if (samples.empty() || !(period_s > 0.0)) return frames;

  frames.resize(frame_index(samples.back().timestamp_s, period_s) + 1);
  for (const auto& s : samples) {
    const std::size_t fi = frame_index(s.timestamp_s, period_s);
    if (fi >= frames.size()) continue; // unsorted input
    frames[fi][s.key] = FrameValue{s.type, s.type_name, s.value, s.metadata};
  }
  return frames;
}

} // namespace lrp
