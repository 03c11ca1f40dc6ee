#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <lrp/log_codec.hpp>
#include <lrp/value.hpp>

namespace lrp {

struct LogEntry {
  std::uint32_t id = 0;
  std::string name;
  std::string type_name;
  ValueType type = ValueType::Raw;
  std::string metadata; // overwritten by SetMetadata
};

// Live entries during a single forward pass over a log.
class EntryRegistry {
public:
  enum class Applied { Started, Finished, MetadataSet, Ignored };

  // Mutate the table from a control record. Unrecognized subtypes and
  // SetMetadata for unknown ids leave it untouched.
  Applied apply(const Record& control);

  // Entry owning a data record, or nullptr if never started or finished.
  const LogEntry* resolve(std::uint32_t id) const;

  std::size_t size() const { return entries_.size(); }

private:
  std::unordered_map<std::uint32_t, LogEntry> entries_;
};

} // namespace lrp
