#include <lrp/value.hpp>
#include <array>
#include <bit>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <nlohmann/json.hpp>

namespace lrp {

namespace {

struct TypeNameEntry {
  ValueType type;
  const char* name;
};

constexpr std::array<TypeNameEntry, 11> kTypeNames{{
  {ValueType::Boolean,      "boolean"},
  {ValueType::Int64,        "int64"},
  {ValueType::Float,        "float"},
  {ValueType::Double,       "double"},
  {ValueType::String,       "string"},
  {ValueType::BooleanArray, "boolean[]"},
  {ValueType::Int64Array,   "int64[]"},
  {ValueType::FloatArray,   "float[]"},
  {ValueType::DoubleArray,  "double[]"},
  {ValueType::StringArray,  "string[]"},
  {ValueType::Raw,          "raw"},
}};

template <class T>
std::string shortest(T v) {
  char buf[64];
  auto res = std::to_chars(buf, buf + sizeof(buf), v);
  return std::string(buf, res.ptr);
}

std::string g6(double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.6g", v);
  return buf;
}

float float_at(const std::uint8_t* p) {
  return std::bit_cast<float>(static_cast<std::uint32_t>(read_le(p, 4)));
}

double double_at(const std::uint8_t* p) {
  return std::bit_cast<double>(read_le(p, 8));
}

std::int64_t int64_at(const std::uint8_t* p, std::size_t width) {
  std::uint64_t u = read_le(p, width);
  if (width < 8 && (u >> (8 * width - 1)) & 1u) {
    u |= ~std::uint64_t{0} << (8 * width); // sign-extend
  }
  return static_cast<std::int64_t>(u);
}

template <class Fn>
std::string join_fixed(ByteView p, std::size_t width, Fn&& fmt) {
  std::string out;
  for (std::size_t i = 0; i + width <= p.size(); i += width) {
    if (i) out.push_back(',');
    out += fmt(p.data() + i);
  }
  return out;
}

std::vector<std::string> split_commas(const std::string& s) {
  std::vector<std::string> out;
  if (s.empty()) return out;
  std::string cur;
  for (char c : s) {
    if (c == ',') { out.push_back(cur); cur.clear(); }
    else { cur.push_back(c); }
  }
  out.push_back(cur);
  return out;
}

double to_double_or_zero(const std::string& s) {
  if (s.empty()) return 0.0;
  const char* begin = s.c_str();
  char* end = nullptr;
  const double v = std::strtod(begin, &end);
  if (end == begin) return 0.0;
  while (*end == ' ' || *end == '\t') ++end;
  return *end == '\0' ? v : 0.0;
}

int hex_nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

ValueType value_type_from_name(std::string_view name) {
  for (const auto& e : kTypeNames) {
    if (name == e.name) return e.type;
  }
  return ValueType::Raw;
}

const char* value_type_name(ValueType t) {
  for (const auto& e : kTypeNames) {
    if (e.type == t) return e.name;
  }
  return "raw";
}

std::string bool_text(bool b) { return b ? "True" : "False"; }

bool parse_bool_text(std::string_view s) {
  return s == "True" || s == "true" || s == "1" || s == "t" || s == "T";
}

std::optional<std::string> decode_boolean(ByteView p) {
  if (p.empty()) return std::nullopt;
  return bool_text(p[0] != 0);
}

std::optional<std::string> decode_int64(ByteView p) {
  if (p.empty() || p.size() > 8) return std::nullopt;
  return std::to_string(int64_at(p.data(), p.size()));
}

std::optional<std::string> decode_float(ByteView p) {
  if (p.size() != 4) return std::nullopt;
  return shortest(float_at(p.data()));
}

std::optional<std::string> decode_double(ByteView p) {
  if (p.size() != 8) return std::nullopt;
  return shortest(double_at(p.data()));
}

std::optional<std::string> decode_string(ByteView p) {
  if (!is_valid_utf8(p)) return std::nullopt;
  return std::string(reinterpret_cast<const char*>(p.data()), p.size());
}

std::optional<std::string> decode_boolean_array(ByteView p) {
  return join_fixed(p, 1, [](const std::uint8_t* b) { return bool_text(*b != 0); });
}

std::optional<std::string> decode_int64_array(ByteView p) {
  if (p.size() % 8 != 0) return std::nullopt;
  return join_fixed(p, 8, [](const std::uint8_t* b) { return std::to_string(int64_at(b, 8)); });
}

std::optional<std::string> decode_float_array(ByteView p) {
  if (p.size() % 4 != 0) return std::nullopt;
  return join_fixed(p, 4, [](const std::uint8_t* b) { return g6(float_at(b)); });
}

std::optional<std::string> decode_double_array(ByteView p) {
  if (p.size() % 8 != 0) return std::nullopt;
  return join_fixed(p, 8, [](const std::uint8_t* b) { return g6(double_at(b)); });
}

std::optional<std::string> decode_string_array(ByteView p) {
  ByteCursor cur(p);
  auto count = cur.u32();
  if (!count) return std::nullopt;
  std::string out;
  for (std::uint32_t i = 0; i < *count; ++i) {
    auto s = cur.prefixed_str();
    if (!s) return std::nullopt;
    if (!is_valid_utf8(ByteView(reinterpret_cast<const std::uint8_t*>(s->data()), s->size()))) {
      return std::nullopt;
    }
    if (i) out.push_back(',');
    out += *s;
  }
  return out;
}

std::string decode_raw(ByteView p) { return to_hex(p); }

std::optional<std::string> decode_value(ValueType t, ByteView payload) {
  switch (t) {
    case ValueType::Boolean:      return decode_boolean(payload);
    case ValueType::Int64:        return decode_int64(payload);
    case ValueType::Float:        return decode_float(payload);
    case ValueType::Double:       return decode_double(payload);
    case ValueType::String:       return decode_string(payload);
    case ValueType::BooleanArray: return decode_boolean_array(payload);
    case ValueType::Int64Array:   return decode_int64_array(payload);
    case ValueType::FloatArray:   return decode_float_array(payload);
    case ValueType::DoubleArray:  return decode_double_array(payload);
    case ValueType::StringArray:  return decode_string_array(payload);
    case ValueType::Raw:          return decode_raw(payload);
  }
  return std::nullopt;
}

std::string raw_type_tag(const std::string& type_name, const std::string& metadata) {
  if (!metadata.empty()) {
    const auto meta = nlohmann::json::parse(metadata, nullptr, /*allow_exceptions*/ false);
    if (meta.is_object()) {
      auto it = meta.find("type");
      if (it != meta.end() && it->is_string()) {
        auto tag = it->get<std::string>();
        if (!tag.empty()) return tag;
      }
    }
  }
  if (!type_name.empty() && type_name != "raw") return type_name;
  return "raw";
}

TypedValue to_typed_value(ValueType t,
                          const std::string& type_name,
                          const std::string& value,
                          const std::string& metadata) {
  switch (t) {
    case ValueType::Boolean:
      return parse_bool_text(value);
    case ValueType::Int64:
    case ValueType::Float:
    case ValueType::Double:
      return to_double_or_zero(value);
    case ValueType::String:
      return value;
    case ValueType::BooleanArray: {
      std::vector<bool> out;
      for (const auto& x : split_commas(value)) out.push_back(parse_bool_text(x));
      return out;
    }
    case ValueType::Int64Array:
    case ValueType::FloatArray:
    case ValueType::DoubleArray: {
      std::vector<double> out;
      for (const auto& x : split_commas(value)) out.push_back(to_double_or_zero(x));
      return out;
    }
    case ValueType::StringArray:
      return split_commas(value);
    case ValueType::Raw: {
      RawBytes raw;
      raw.bytes = from_hex(value).value_or(Bytes{});
      raw.type_tag = raw_type_tag(type_name, metadata);
      return raw;
    }
  }
  return value;
}

// ---- byte helpers ----------------------------------------------------------

std::string to_hex(ByteView data) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (auto b : data) {
    out.push_back(kHex[(b >> 4) & 0x0F]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

std::optional<Bytes> from_hex(const std::string& text) {
  if (text.size() % 2 != 0) return std::nullopt;
  Bytes out;
  out.reserve(text.size() / 2);
  for (std::size_t i = 0; i < text.size(); i += 2) {
    const int hi = hex_nibble(text[i]);
    const int lo = hex_nibble(text[i + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return out;
}

bool is_valid_utf8(ByteView data) {
  std::size_t i = 0;
  const std::size_t n = data.size();
  while (i < n) {
    const std::uint8_t c = data[i];
    std::size_t len = 0;
    std::uint32_t cp = 0;
    if (c < 0x80) { ++i; continue; }
    else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
    else return false;
    if (i + len > n) return false;
    for (std::size_t k = 1; k < len; ++k) {
      const std::uint8_t cc = data[i + k];
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // Overlong forms, surrogates and out-of-range code points.
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    i += len;
  }
  return true;
}

} // namespace lrp
