#include <lrp/log_codec.hpp>
#include <algorithm>
#include <cstring>

namespace lrp {

static std::optional<StartData> parse_start(ByteView d) {
  if (d.size() < 17) return std::nullopt;
  ByteCursor cur(d, 1);
  StartData sd;
  sd.entry = *cur.u32();
  auto name = cur.prefixed_str();
  if (!name) return std::nullopt;
  auto type = cur.prefixed_str();
  if (!type) return std::nullopt;
  auto meta = cur.prefixed_str();
  if (!meta) return std::nullopt;
  sd.name = std::move(*name);
  sd.type = std::move(*type);
  sd.metadata = std::move(*meta);
  return sd;
}

static std::optional<MetadataData> parse_set_metadata(ByteView d) {
  if (d.size() < 9) return std::nullopt;
  ByteCursor cur(d, 1);
  MetadataData md;
  md.entry = *cur.u32();
  auto meta = cur.prefixed_str();
  if (!meta) return std::nullopt;
  md.metadata = std::move(*meta);
  return md;
}

Control parse_control(const Record& rec) {
  if (!rec.is_control() || rec.payload.empty()) return std::monostate{};
  const ByteView d = rec.payload;
  switch (d[0]) {
    case static_cast<std::uint8_t>(ControlType::Start):
      if (auto sd = parse_start(d)) return *sd;
      break;
    case static_cast<std::uint8_t>(ControlType::Finish):
      if (d.size() == 5) return FinishData{read_u32_le(d.data() + 1)};
      break;
    case static_cast<std::uint8_t>(ControlType::SetMetadata):
      if (auto md = parse_set_metadata(d)) return *md;
      break;
    default:
      break;
  }
  return std::monostate{};
}

// ---- LogReader -------------------------------------------------------------

bool LogReader::valid() const {
  if (data_.size() < kPrologueSize) return false;
  if (std::memcmp(data_.data(), kLogMagic, kLogMagicSize) != 0) return false;
  const std::uint64_t hdr_len = read_u32_le(data_.data() + 8);
  return kPrologueSize + hdr_len <= data_.size();
}

std::uint16_t LogReader::version() const {
  if (data_.size() < 8) return 0;
  return static_cast<std::uint16_t>(read_le(data_.data() + 6, 2));
}

std::string LogReader::extra_header() const {
  if (data_.size() < kPrologueSize) return {};
  const std::size_t start = kPrologueSize;
  const std::size_t end = data_offset();
  return std::string(reinterpret_cast<const char*>(data_.data() + start), end - start);
}

std::size_t LogReader::data_offset() const {
  if (data_.size() < kPrologueSize) return data_.size();
  const std::uint64_t off = kPrologueSize + static_cast<std::uint64_t>(read_u32_le(data_.data() + 8));
  return static_cast<std::size_t>(std::min<std::uint64_t>(off, data_.size()));
}

std::optional<Record> LogReader::read_at(std::size_t pos) const {
  const std::size_t n = data_.size();
  if (pos >= n) return std::nullopt;

  const std::uint8_t head = data_[pos];
  const std::size_t entry_w = (head & 0x3) + 1;
  const std::size_t size_w  = ((head >> 2) & 0x3) + 1;
  const std::size_t ts_w    = ((head >> 4) & 0x7) + 1;
  const std::size_t hdr = 1 + entry_w + size_w + ts_w;
  if (n - pos < hdr) return std::nullopt;

  const std::uint8_t* p = data_.data() + pos + 1;
  Record rec;
  rec.offset = pos;
  rec.entry = static_cast<std::uint32_t>(read_le(p, entry_w));
  const std::uint64_t size = read_le(p + entry_w, size_w);
  rec.timestamp_us = read_le(p + entry_w + size_w, ts_w);

  if (static_cast<std::uint64_t>(n - pos - hdr) < size) return std::nullopt;
  rec.payload = data_.subspan(pos + hdr, static_cast<std::size_t>(size));
  rec.next_offset = pos + hdr + static_cast<std::size_t>(size);
  return rec;
}

LogReader::iterator::iterator(const LogReader* r, std::size_t pos) : reader_(r) {
  cur_ = reader_->read_at(pos);
}

LogReader::iterator& LogReader::iterator::operator++() {
  if (cur_) cur_ = reader_->read_at(cur_->next_offset);
  return *this;
}

} // namespace lrp
