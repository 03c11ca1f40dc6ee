#include <catch2/catch.hpp>
#include <string>
#include <vector>

#include <lrp/timeline.hpp>

using Catch::Detail::Approx;
using namespace lrp;

static Sample flag(double t, const std::string& key, bool v) {
  Sample s;
  s.timestamp_s = t;
  s.key = key;
  s.type = ValueType::Boolean;
  s.type_name = "boolean";
  s.value = bool_text(v);
  return s;
}

static Sample other(double t) {
  Sample s;
  s.timestamp_s = t;
  s.key = "/drive/speed";
  s.type = ValueType::Double;
  s.type_name = "double";
  s.value = "1";
  return s;
}

TEST_CASE("match with autonomous then teleop") {
  std::vector<Sample> samples{
    flag(1.0, "DS:enabled", true),
    flag(1.0, "DS:autonomous", true),
    flag(16.0, "DS:autonomous", false),
    other(30.0),
  };
  const auto segs = compute_timeline(samples);
  REQUIRE(segs.size() == 3);
  REQUIRE(segs[0] == TimelineSegment{0.0, 1.0, RobotState::Disabled});
  REQUIRE(segs[1] == TimelineSegment{1.0, 16.0, RobotState::Autonomous});
  REQUIRE(segs[2] == TimelineSegment{16.0, 30.0, RobotState::Teleop});
  REQUIRE(std::string(robot_state_name(segs[2].state)) == "teleop");
}

TEST_CASE("flag order at the same instant does not matter") {
  std::vector<Sample> samples{
    flag(1.0, "DS:autonomous", true),
    flag(1.0, "DS:enabled", true),
    other(5.0),
  };
  const auto segs = compute_timeline(samples);
  REQUIRE(segs.size() == 2);
  REQUIRE(segs[0] == TimelineSegment{0.0, 1.0, RobotState::Disabled});
  REQUIRE(segs[1] == TimelineSegment{1.0, 5.0, RobotState::Autonomous});
}

TEST_CASE("estop overrides every other flag") {
  std::vector<Sample> samples{
    flag(0.5, "DS:enabled", true),
    flag(2.0, "DS:estop", true),
    flag(3.0, "DS:enabled", false),
    flag(4.0, "DS:autonomous", true),
    other(6.0),
  };
  const auto segs = compute_timeline(samples);
  REQUIRE(segs.size() == 3);
  REQUIRE(segs[1] == TimelineSegment{0.5, 2.0, RobotState::Teleop});
  REQUIRE(segs[2].state == RobotState::EStop);
  REQUIRE(segs[2].start_s == Approx(2.0));
  REQUIRE(segs[2].end_s == Approx(6.0));
}

TEST_CASE("a flag flipped back at the same instant leaves no gap") {
  std::vector<Sample> samples{
    flag(1.0, "DS:enabled", true),
    flag(2.0, "DS:enabled", false),
    flag(2.0, "DS:enabled", true),
    other(3.0),
  };
  const auto segs = compute_timeline(samples);
  REQUIRE(segs.size() == 2);
  REQUIRE(segs[1] == TimelineSegment{1.0, 3.0, RobotState::Teleop});
}

TEST_CASE("no flags gives one disabled segment and no samples gives none") {
  const auto segs = compute_timeline({other(0.0), other(8.0)});
  REQUIRE(segs.size() == 1);
  REQUIRE(segs[0] == TimelineSegment{0.0, 8.0, RobotState::Disabled});

  REQUIRE(compute_timeline({}).empty());
}
