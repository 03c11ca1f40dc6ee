#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <lrp/bytes.hpp>

namespace lrp {

// Builds a log buffer in the format LogReader decodes. Field widths are the
// minimum that holds each value.
class LogWriter {
public:
  explicit LogWriter(const std::string& extra_header = {});

  void start(std::uint32_t entry, const std::string& name, const std::string& type,
             const std::string& metadata, std::uint64_t timestamp_us);
  void finish(std::uint32_t entry, std::uint64_t timestamp_us);
  void set_metadata(std::uint32_t entry, const std::string& metadata, std::uint64_t timestamp_us);

  // Data record with an arbitrary payload.
  void append(std::uint32_t entry, std::uint64_t timestamp_us, ByteView payload);
  // Control record with an arbitrary payload (entry id 0).
  void append_control(std::uint64_t timestamp_us, ByteView payload);

  void append_boolean(std::uint32_t entry, std::uint64_t ts, bool v);
  void append_int64(std::uint32_t entry, std::uint64_t ts, std::int64_t v);
  void append_float(std::uint32_t entry, std::uint64_t ts, float v);
  void append_double(std::uint32_t entry, std::uint64_t ts, double v);
  void append_string(std::uint32_t entry, std::uint64_t ts, const std::string& v);
  void append_boolean_array(std::uint32_t entry, std::uint64_t ts, const std::vector<bool>& v);
  void append_int64_array(std::uint32_t entry, std::uint64_t ts, const std::vector<std::int64_t>& v);
  void append_float_array(std::uint32_t entry, std::uint64_t ts, const std::vector<float>& v);
  void append_double_array(std::uint32_t entry, std::uint64_t ts, const std::vector<double>& v);
  void append_string_array(std::uint32_t entry, std::uint64_t ts, const std::vector<std::string>& v);

  const Bytes& buffer() const { return buf_; }
  Bytes take() { return std::move(buf_); }

private:
  void record_(std::uint32_t entry, std::uint64_t ts, ByteView payload);

  Bytes buf_;
};

} // namespace lrp
