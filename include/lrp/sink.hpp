#pragma once
#include <string>
#include <lrp/value.hpp>

namespace lrp {

// External key/value target receiving replayed updates. Calls come from the
// playback thread (put/flush) and the control thread (set_server); an
// implementation serializes them itself. Failures may be reported by
// throwing; the scheduler treats every failure as non-fatal.
class Sink {
public:
  virtual ~Sink() = default;

  virtual void set_server(const std::string& host, int port) = 0;
  virtual void put(const std::string& key,
                   ValueType type,
                   const std::string& type_name,
                   const std::string& value,
                   const std::string& metadata) = 0;
  // End of one frame's updates.
  virtual void flush() {}
};

} // namespace lrp
