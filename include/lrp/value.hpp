#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <lrp/bytes.hpp>

namespace lrp {

// Closed set of value encodings a log entry can carry.
enum class ValueType : std::uint8_t {
  Boolean,
  Int64,
  Float,
  Double,
  String,
  BooleanArray,
  Int64Array,
  FloatArray,
  DoubleArray,
  StringArray,
  Raw, // any type name not listed above
};

// "boolean", "int64[]", ... ; unknown names map to Raw.
ValueType value_type_from_name(std::string_view name);
const char* value_type_name(ValueType t);

// Decode a data record payload into its interchange text form.
// Returns nullopt when the payload does not fit the type (wrong length,
// truncated string array, invalid UTF-8).
std::optional<std::string> decode_value(ValueType t, ByteView payload);

// One decoder per variant.
std::optional<std::string> decode_boolean(ByteView p);
std::optional<std::string> decode_int64(ByteView p);
std::optional<std::string> decode_float(ByteView p);
std::optional<std::string> decode_double(ByteView p);
std::optional<std::string> decode_string(ByteView p);
std::optional<std::string> decode_boolean_array(ByteView p);
std::optional<std::string> decode_int64_array(ByteView p);
std::optional<std::string> decode_float_array(ByteView p);
std::optional<std::string> decode_double_array(ByteView p);
std::optional<std::string> decode_string_array(ByteView p);
std::string decode_raw(ByteView p);

// Interchange text for a boolean: "True" / "False".
std::string bool_text(bool b);
// Accepts True, true, 1, t, T.
bool parse_bool_text(std::string_view s);

struct RawBytes {
  Bytes bytes;
  std::string type_tag; // out-of-band type for the sink, e.g. "struct:Pose2d"
  bool operator==(const RawBytes&) const = default;
};

// Typed form of an interchange value as handed to a sink.
using TypedValue = std::variant<bool,
                                double,
                                std::string,
                                std::vector<bool>,
                                std::vector<double>,
                                std::vector<std::string>,
                                RawBytes>;

TypedValue to_typed_value(ValueType t,
                          const std::string& type_name,
                          const std::string& value,
                          const std::string& metadata);

// Raw type tag: metadata JSON "type" field, else type_name unless it is
// plain "raw", else "raw".
std::string raw_type_tag(const std::string& type_name, const std::string& metadata);

} // namespace lrp
