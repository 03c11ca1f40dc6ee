#include <catch2/catch.hpp>
#include <bit>
#include <string>
#include <vector>

#include <lrp/value.hpp>

using Catch::Detail::Approx;
using namespace lrp;

static Bytes le64(std::uint64_t v) {
  Bytes b;
  write_le(b, v, 8);
  return b;
}

TEST_CASE("value type names map both ways and unknown names are raw") {
  REQUIRE(value_type_from_name("boolean") == ValueType::Boolean);
  REQUIRE(value_type_from_name("int64[]") == ValueType::Int64Array);
  REQUIRE(value_type_from_name("string[]") == ValueType::StringArray);
  REQUIRE(value_type_from_name("struct:Pose2d") == ValueType::Raw);
  REQUIRE(value_type_from_name("json") == ValueType::Raw);
  REQUIRE(std::string(value_type_name(ValueType::DoubleArray)) == "double[]");
}

TEST_CASE("scalar decoders") {
  REQUIRE(decode_boolean(Bytes{0x02}).value() == "True");
  REQUIRE(decode_boolean(Bytes{0x00}).value() == "False");
  REQUIRE_FALSE(decode_boolean(Bytes{}).has_value());

  REQUIRE(decode_int64(le64(static_cast<std::uint64_t>(-42))).value() == "-42");
  REQUIRE(decode_int64(Bytes{0xFF}).value() == "-1");       // short payloads sign-extend
  REQUIRE(decode_int64(Bytes{0x7F, 0x00}).value() == "127");

  REQUIRE(decode_double(le64(std::bit_cast<std::uint64_t>(1.5))).value() == "1.5");
  REQUIRE_FALSE(decode_double(Bytes{1, 2, 3}).has_value());

  Bytes f;
  write_le(f, std::bit_cast<std::uint32_t>(0.25f), 4);
  REQUIRE(decode_float(f).value() == "0.25");
  REQUIRE_FALSE(decode_float(le64(0)).has_value());
}

TEST_CASE("string decoder rejects invalid UTF-8") {
  const std::string ok = "caf\xc3\xa9";
  REQUIRE(decode_string(Bytes(ok.begin(), ok.end())).value() == ok);
  REQUIRE_FALSE(decode_string(Bytes{0xC3}).has_value());
  REQUIRE(decode_string(Bytes{}).value().empty());
}

TEST_CASE("array decoders join with commas") {
  REQUIRE(decode_boolean_array(Bytes{1, 0, 1}).value() == "True,False,True");
  REQUIRE(decode_boolean_array(Bytes{}).value().empty());

  Bytes ints = le64(1);
  auto m = le64(static_cast<std::uint64_t>(-2));
  ints.insert(ints.end(), m.begin(), m.end());
  REQUIRE(decode_int64_array(ints).value() == "1,-2");
  ints.pop_back();
  REQUIRE_FALSE(decode_int64_array(ints).has_value());

  Bytes dbl = le64(std::bit_cast<std::uint64_t>(3.14159265));
  auto d2 = le64(std::bit_cast<std::uint64_t>(-0.5));
  dbl.insert(dbl.end(), d2.begin(), d2.end());
  REQUIRE(decode_double_array(dbl).value() == "3.14159,-0.5");

  Bytes strs;
  write_u32_le(strs, 2);
  write_u32_le(strs, 2); strs.push_back('a'); strs.push_back('b');
  write_u32_le(strs, 1); strs.push_back('c');
  REQUIRE(decode_string_array(strs).value() == "ab,c");
  strs.pop_back();
  REQUIRE_FALSE(decode_string_array(strs).has_value());
}

TEST_CASE("raw values are lowercase hex and decode_value never fails for raw") {
  REQUIRE(decode_raw(Bytes{0x00, 0xAB, 0x10}) == "00ab10");
  REQUIRE(decode_value(ValueType::Raw, Bytes{}).value().empty());
  REQUIRE(from_hex("00ab10").value() == Bytes{0x00, 0xAB, 0x10});
  REQUIRE_FALSE(from_hex("abc").has_value());
  REQUIRE_FALSE(from_hex("zz").has_value());
}

TEST_CASE("to_typed_value follows sink conversion rules") {
  REQUIRE(std::get<bool>(to_typed_value(ValueType::Boolean, "boolean", "True", "")));
  REQUIRE(std::get<bool>(to_typed_value(ValueType::Boolean, "boolean", "t", "")));
  REQUIRE_FALSE(std::get<bool>(to_typed_value(ValueType::Boolean, "boolean", "yes", "")));

  REQUIRE(std::get<double>(to_typed_value(ValueType::Int64, "int64", "12", "")) == Approx(12.0));
  REQUIRE(std::get<double>(to_typed_value(ValueType::Double, "double", "oops", "")) == Approx(0.0));

  auto nums = std::get<std::vector<double>>(to_typed_value(ValueType::FloatArray, "float[]", "1.5,x,2", ""));
  REQUIRE(nums == std::vector<double>{1.5, 0.0, 2.0});
  REQUIRE(std::get<std::vector<double>>(to_typed_value(ValueType::DoubleArray, "double[]", "", "")).empty());

  auto strs = std::get<std::vector<std::string>>(to_typed_value(ValueType::StringArray, "string[]", "a,b", ""));
  REQUIRE(strs == std::vector<std::string>{"a", "b"});

  auto bools = std::get<std::vector<bool>>(to_typed_value(ValueType::BooleanArray, "boolean[]", "True,False", ""));
  REQUIRE(bools == std::vector<bool>{true, false});
}

TEST_CASE("raw type tag comes from metadata, then type name, then raw") {
  REQUIRE(raw_type_tag("raw", R"({"type":"struct:Pose2d","schema":"x"})") == "struct:Pose2d");
  REQUIRE(raw_type_tag("struct:Pose3d", "") == "struct:Pose3d");
  REQUIRE(raw_type_tag("raw", "not json") == "raw");
  REQUIRE(raw_type_tag("raw", R"({"type":7})") == "raw");

  auto raw = std::get<RawBytes>(to_typed_value(ValueType::Raw, "raw", "0102", R"({"type":"proto:X"})"));
  REQUIRE(raw.bytes == Bytes{1, 2});
  REQUIRE(raw.type_tag == "proto:X");

  auto bad = std::get<RawBytes>(to_typed_value(ValueType::Raw, "raw", "0g", ""));
  REQUIRE(bad.bytes.empty());
}
