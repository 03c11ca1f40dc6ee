#include <lrp/log_writer.hpp>
#include <lrp/log_codec.hpp>
#include <bit>

namespace lrp {

static void put_prefixed(Bytes& out, const std::string& s) {
  write_u32_le(out, static_cast<std::uint32_t>(s.size()));
  out.insert(out.end(), s.begin(), s.end());
}

LogWriter::LogWriter(const std::string& extra_header) {
  buf_.insert(buf_.end(), kLogMagic, kLogMagic + kLogMagicSize);
  write_le(buf_, kLogVersion, 2);
  put_prefixed(buf_, extra_header);
}

void LogWriter::record_(std::uint32_t entry, std::uint64_t ts, ByteView payload) {
  const std::size_t ew = le_width(entry, 4);
  const std::size_t sw = le_width(payload.size(), 4);
  const std::size_t tw = le_width(ts, 8);
  buf_.push_back(static_cast<std::uint8_t>((ew - 1) | ((sw - 1) << 2) | ((tw - 1) << 4)));
  write_le(buf_, entry, ew);
  write_le(buf_, payload.size(), sw);
  write_le(buf_, ts, tw);
  buf_.insert(buf_.end(), payload.begin(), payload.end());
}

void LogWriter::start(std::uint32_t entry, const std::string& name, const std::string& type,
                      const std::string& metadata, std::uint64_t timestamp_us) {
  Bytes p{static_cast<std::uint8_t>(ControlType::Start)};
  write_u32_le(p, entry);
  put_prefixed(p, name);
  put_prefixed(p, type);
  put_prefixed(p, metadata);
  record_(0, timestamp_us, p);
}

void LogWriter::finish(std::uint32_t entry, std::uint64_t timestamp_us) {
  Bytes p{static_cast<std::uint8_t>(ControlType::Finish)};
  write_u32_le(p, entry);
  record_(0, timestamp_us, p);
}

void LogWriter::set_metadata(std::uint32_t entry, const std::string& metadata, std::uint64_t timestamp_us) {
  Bytes p{static_cast<std::uint8_t>(ControlType::SetMetadata)};
  write_u32_le(p, entry);
  put_prefixed(p, metadata);
  record_(0, timestamp_us, p);
}

void LogWriter::append(std::uint32_t entry, std::uint64_t timestamp_us, ByteView payload) {
  record_(entry, timestamp_us, payload);
}

void LogWriter::append_control(std::uint64_t timestamp_us, ByteView payload) {
  record_(0, timestamp_us, payload);
}

void LogWriter::append_boolean(std::uint32_t entry, std::uint64_t ts, bool v) {
  const Bytes p{static_cast<std::uint8_t>(v ? 1 : 0)};
  record_(entry, ts, p);
}

void LogWriter::append_int64(std::uint32_t entry, std::uint64_t ts, std::int64_t v) {
  Bytes p;
  write_le(p, static_cast<std::uint64_t>(v), 8);
  record_(entry, ts, p);
}

void LogWriter::append_float(std::uint32_t entry, std::uint64_t ts, float v) {
  Bytes p;
  write_le(p, std::bit_cast<std::uint32_t>(v), 4);
  record_(entry, ts, p);
}

void LogWriter::append_double(std::uint32_t entry, std::uint64_t ts, double v) {
  Bytes p;
  write_le(p, std::bit_cast<std::uint64_t>(v), 8);
  record_(entry, ts, p);
}

void LogWriter::append_string(std::uint32_t entry, std::uint64_t ts, const std::string& v) {
  const Bytes p(v.begin(), v.end());
  record_(entry, ts, p);
}

void LogWriter::append_boolean_array(std::uint32_t entry, std::uint64_t ts, const std::vector<bool>& v) {
  Bytes p;
  for (bool b : v) p.push_back(b ? 1 : 0);
  record_(entry, ts, p);
}

void LogWriter::append_int64_array(std::uint32_t entry, std::uint64_t ts, const std::vector<std::int64_t>& v) {
  Bytes p;
  for (auto x : v) write_le(p, static_cast<std::uint64_t>(x), 8);
  record_(entry, ts, p);
}

void LogWriter::append_float_array(std::uint32_t entry, std::uint64_t ts, const std::vector<float>& v) {
  Bytes p;
  for (auto x : v) write_le(p, std::bit_cast<std::uint32_t>(x), 4);
  record_(entry, ts, p);
}

void LogWriter::append_double_array(std::uint32_t entry, std::uint64_t ts, const std::vector<double>& v) {
  Bytes p;
  for (auto x : v) write_le(p, std::bit_cast<std::uint64_t>(x), 8);
  record_(entry, ts, p);
}

void LogWriter::append_string_array(std::uint32_t entry, std::uint64_t ts, const std::vector<std::string>& v) {
  Bytes p;
  write_u32_le(p, static_cast<std::uint32_t>(v.size()));
  for (const auto& s : v) put_prefixed(p, s);
  record_(entry, ts, p);
}

} // namespace lrp
