#include <catch2/catch.hpp>
#include <string>
#include <vector>

#include <lrp/frames.hpp>

using namespace lrp;

static Sample at(double t, const std::string& key, const std::string& value) {
  Sample s;
  s.timestamp_s = t;
  s.key = key;
  s.type = ValueType::String;
  s.type_name = "string";
  s.value = value;
  return s;
}

TEST_CASE("frame_index floors into the period grid") {
  REQUIRE(frame_index(0.0, 0.02) == 0);
  REQUIRE(frame_index(0.019, 0.02) == 0);
  REQUIRE(frame_index(0.021, 0.02) == 1);
  REQUIRE(frame_index(1.0, 0.02) == 50);
}

TEST_CASE("last write in a slot wins") {
  std::vector<Sample> samples{
    at(0.015, "DS:enabled", "False"),
    at(0.019, "DS:enabled", "True"),
  };
  samples[0].type = samples[1].type = ValueType::Boolean;
  const auto frames = coalesce_frames(samples, 0.020);
  REQUIRE(frames.size() == 1);
  REQUIRE(frames[0].at("DS:enabled").value == "True");
  REQUIRE(frames[0].at("DS:enabled").type == ValueType::Boolean);
}

TEST_CASE("frame count follows the last timestamp") {
  std::vector<Sample> samples{
    at(0.00, "a", "1"),
    at(0.05, "b", "2"),
    at(0.99, "a", "3"),
  };
  const auto frames = coalesce_frames(samples, 0.020);
  REQUIRE(frames.size() == 50);
  REQUIRE(frames[0].at("a").value == "1");
  REQUIRE(frames[2].at("b").value == "2");
  REQUIRE(frames[49].at("a").value == "3");
  REQUIRE(frames[10].empty());
}

TEST_CASE("degenerate inputs") {
  REQUIRE(coalesce_frames({}).empty());

  const auto one = coalesce_frames({at(0.0, "only", "x")});
  REQUIRE(one.size() == 1);
  REQUIRE(one[0].size() == 1);

  auto s = at(0.0, "m", "v");
  s.metadata = "{\"unit\":\"m\"}";
  const auto with_meta = coalesce_frames({s});
  REQUIRE(with_meta[0].at("m").metadata == "{\"unit\":\"m\"}");
}
