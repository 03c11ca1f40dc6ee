#pragma once
#include <string>
#include <vector>
#include <lrp/sample.hpp>

namespace lrp {

enum class RobotState {
  Disabled,
  Teleop,
  Autonomous,
  EStop,
};

const char* robot_state_name(RobotState s); // "disabled", "teleop", ...

struct TimelineSegment {
  double start_s = 0.0;
  double end_s = 0.0;
  RobotState state = RobotState::Disabled;

  bool operator==(const TimelineSegment&) const = default;
};

// Walk the DS:enabled / DS:autonomous / DS:estop flags of a sorted sample list.
// Precedence: estop > disabled > autonomous > teleop. The last segment ends at
// the final sample; an empty list gives no segments.
std::vector<TimelineSegment> compute_timeline(const std::vector<Sample>& samples);

} // namespace lrp
