#include <lrp/timeline.hpp>
#include <string_view>

namespace lrp {

namespace {

constexpr std::string_view kFlagPrefix = "DS:";

struct Flags {
  bool enabled = false;
  bool autonomous = false;
  bool estop = false;

  RobotState state() const {
    if (estop) return RobotState::EStop;
    if (!enabled) return RobotState::Disabled;
    if (autonomous) return RobotState::Autonomous;
    return RobotState::Teleop;
  }

  // False when the key is not one of the tracked flags.
  bool set(std::string_view name, bool v) {
    if (name == "enabled") enabled = v;
    else if (name == "autonomous") autonomous = v;
    else if (name == "estop") estop = v;
    else return false;
    return true;
  }
};

} // namespace

const char* robot_state_name(RobotState s) {
  switch (s) {
    case RobotState::Disabled:   return "disabled";
    case RobotState::Teleop:     return "teleop";
    case RobotState::Autonomous: return "autonomous";
    case RobotState::EStop:      return "estop";
  }
  return "disabled";
}

std::vector<TimelineSegment> compute_timeline(const std::vector<Sample>& samples) {
  std::vector<TimelineSegment> segs;
  if (samples.empty()) return segs;

  Flags flags;
  RobotState cur = flags.state();
  double start = 0.0;

  for (const auto& s : samples) {
    std::string_view key = s.key;
    if (key.substr(0, kFlagPrefix.size()) != kFlagPrefix) continue;
    if (!flags.set(key.substr(kFlagPrefix.size()), parse_bool_text(s.value))) continue;

    const RobotState next = flags.state();
    if (next == cur) continue;
    if (s.timestamp_s > start) {
      segs.push_back({start, s.timestamp_s, cur});
      start = s.timestamp_s;
    } else if (!segs.empty() && segs.back().state == next) {
      // Flipped back at the same instant: rejoin the previous segment.
      start = segs.back().start_s;
      segs.pop_back();
    }
    cur = next;
  }

  const double end = samples.back().timestamp_s;
  if (end > start || segs.empty()) segs.push_back({start, end, cur});
  return segs;
}

} // namespace lrp
