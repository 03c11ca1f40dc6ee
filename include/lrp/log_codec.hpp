#pragma once
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <variant>
#include <lrp/bytes.hpp>

namespace lrp {

// Prologue: "WPILOG" magic, u16 version, u32 extra-header length, header text.
inline constexpr char kLogMagic[] = "WPILOG";
inline constexpr std::size_t kLogMagicSize = 6;
inline constexpr std::size_t kPrologueSize = 12;
inline constexpr std::uint16_t kLogVersion = 0x0100;

enum class ControlType : std::uint8_t {
  Start = 0,
  Finish = 1,
  SetMetadata = 2,
};

struct StartData {
  std::uint32_t entry = 0;
  std::string name;
  std::string type;
  std::string metadata;
};

struct FinishData {
  std::uint32_t entry = 0;
};

struct MetadataData {
  std::uint32_t entry = 0;
  std::string metadata;
};

// monostate = unrecognized or malformed control record.
using Control = std::variant<std::monostate, StartData, FinishData, MetadataData>;

// One decoded record. The payload views the reader's buffer, which must
// outlive the record.
struct Record {
  std::uint32_t entry = 0;          // 0 = control record
  std::uint64_t timestamp_us = 0;
  ByteView payload;
  std::size_t offset = 0;           // start of this record's header
  std::size_t next_offset = 0;      // start of the following record

  bool is_control() const { return entry == 0; }
  double timestamp_s() const { return static_cast<double>(timestamp_us) / 1e6; }
};

// Interpret a control record's payload. Start needs >= 17 bytes, Finish
// exactly 5, SetMetadata >= 9; anything else is unrecognized.
Control parse_control(const Record& rec);

// Lazy, restartable record sequence over an immutable buffer.
class LogReader {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Record;
    using difference_type = std::ptrdiff_t;
    using pointer = const Record*;
    using reference = const Record&;

    iterator() = default;

    reference operator*() const { return *cur_; }
    pointer operator->() const { return &*cur_; }
    iterator& operator++();
    iterator operator++(int) { auto tmp = *this; ++*this; return tmp; }

    // Equal when both are exhausted or both sit on the same offset.
    bool operator==(const iterator& o) const {
      if (!cur_ || !o.cur_) return !cur_ && !o.cur_;
      return cur_->offset == o.cur_->offset;
    }

  private:
    friend class LogReader;
    iterator(const LogReader* r, std::size_t pos);
    const LogReader* reader_{nullptr};
    std::optional<Record> cur_;
  };

  explicit LogReader(ByteView data) : data_(data) {}

  // Magic present and prologue complete.
  bool valid() const;
  std::uint16_t version() const;
  std::string extra_header() const;
  // First record offset: 12 + header length (clamped to the buffer size).
  std::size_t data_offset() const;

  iterator begin() const { return iterator(this, data_offset()); }
  iterator end() const { return iterator(); }
  // Restart the sequence at an arbitrary record boundary.
  iterator from(std::size_t offset) const { return iterator(this, offset); }

  // Decode the record at offset; nullopt when fewer bytes remain than the
  // header or payload declares (normal end of data).
  std::optional<Record> read_at(std::size_t offset) const;

private:
  ByteView data_;
};

} // namespace lrp
