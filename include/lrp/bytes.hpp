#pragma once
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace lrp {

using Bytes = std::vector<std::uint8_t>;
using ByteView = std::span<const std::uint8_t>;

// Little-endian unsigned of `width` bytes (1..8) starting at p.
inline std::uint64_t read_le(const std::uint8_t* p, std::size_t width) {
  std::uint64_t v = 0;
  for (std::size_t i = 0; i < width; ++i) {
    v |= static_cast<std::uint64_t>(p[i]) << (8 * i);
  }
  return v;
}

inline std::uint32_t read_u32_le(const std::uint8_t* p) {
  return static_cast<std::uint32_t>(read_le(p, 4));
}

inline void write_le(Bytes& out, std::uint64_t v, std::size_t width) {
  for (std::size_t i = 0; i < width; ++i) {
    out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
  }
}

inline void write_u32_le(Bytes& out, std::uint32_t v) { write_le(out, v, 4); }

// Smallest byte count (1..max_width) that holds v.
inline std::size_t le_width(std::uint64_t v, std::size_t max_width) {
  std::size_t w = 1;
  while (w < max_width && (v >> (8 * w)) != 0) ++w;
  return w;
}

// Bounds-checked cursor over a byte view. Every read returns nullopt once the
// view is exhausted; the cursor does not move on a failed read.
class ByteCursor {
public:
  explicit ByteCursor(ByteView data, std::size_t pos = 0) : data_(data), pos_(pos) {}

  std::size_t pos() const { return pos_; }
  std::size_t remaining() const { return pos_ <= data_.size() ? data_.size() - pos_ : 0; }

  std::optional<std::uint32_t> u32() {
    if (remaining() < 4) return std::nullopt;
    const auto v = read_u32_le(data_.data() + pos_);
    pos_ += 4;
    return v;
  }

  std::optional<std::string> str(std::size_t n) {
    if (remaining() < n) return std::nullopt;
    std::string s(reinterpret_cast<const char*>(data_.data() + pos_), n);
    pos_ += n;
    return s;
  }

  // 4-byte length followed by that many bytes.
  std::optional<std::string> prefixed_str() {
    const std::size_t start = pos_;
    auto n = u32();
    if (!n) return std::nullopt;
    auto s = str(*n);
    if (!s) { pos_ = start; return std::nullopt; }
    return s;
  }

private:
  ByteView data_;
  std::size_t pos_;
};

std::string to_hex(ByteView data);
std::optional<Bytes> from_hex(const std::string& text);
bool is_valid_utf8(ByteView data);

} // namespace lrp
