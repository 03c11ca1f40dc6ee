#pragma once
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <sys/socket.h>
#include <lrp/sink.hpp>

namespace lrp {

// One update as a JSON object (no trailing newline):
// {"key":"<table>/<key>","type":"double","value":1.5,"meta":""}
std::string encode_json_line(const std::string& table,
                             const std::string& key,
                             ValueType type,
                             const std::string& type_name,
                             const std::string& value,
                             const std::string& metadata);

// Newline-delimited JSON over a non-blocking TCP connection. put() only
// appends to an outgoing buffer; flush() makes one non-blocking send attempt.
// A refused or pending connection never blocks the caller; reconnects are
// spaced by kRetryInterval and the buffer is capped, oldest lines dropped.
class JsonLineSink : public Sink {
public:
  static constexpr std::chrono::milliseconds kRetryInterval{1000};

  explicit JsonLineSink(std::string table = "Replay", std::size_t max_buffer_bytes = 1 << 20);
  ~JsonLineSink() override;
  JsonLineSink(const JsonLineSink&) = delete;
  JsonLineSink& operator=(const JsonLineSink&) = delete;

  // Resolves host (may block on DNS for non-numeric names) and drops any
  // existing connection. Throws std::runtime_error if host cannot be resolved.
  void set_server(const std::string& host, int port) override;
  void put(const std::string& key,
           ValueType type,
           const std::string& type_name,
           const std::string& value,
           const std::string& metadata) override;
  void flush() override;

  bool connected() const;
  std::size_t pending_bytes() const;

private:
  using clock = std::chrono::steady_clock;

  void close_();
  bool ensure_connected_(clock::time_point now);
  void trim_buffer_();

  mutable std::mutex mu_;
  std::string table_;
  std::size_t max_buffer_;

  bool has_target_{false};
  sockaddr_storage addr_{};
  socklen_t addr_len_{0};

  int fd_{-1};
  bool connecting_{false};
  clock::time_point next_attempt_{};
  std::string out_;
  bool head_partial_{false}; // first line of out_ already partly sent
};

} // namespace lrp
