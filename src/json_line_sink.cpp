#include <lrp/json_line_sink.hpp>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <type_traits>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include <lrp/logging.hpp>

namespace lrp {

namespace {

nlohmann::json typed_to_json(const TypedValue& v) {
  return std::visit([](const auto& x) -> nlohmann::json {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, RawBytes>) {
      return nlohmann::json{{"bytes", to_hex(x.bytes)}, {"type", x.type_tag}};
    } else {
      return nlohmann::json(x);
    }
  }, v);
}

} // namespace

std::string encode_json_line(const std::string& table,
                             const std::string& key,
                             ValueType type,
                             const std::string& type_name,
                             const std::string& value,
                             const std::string& metadata) {
  nlohmann::json j;
  j["key"] = table.empty() ? key : table + "/" + key;
  j["type"] = type_name.empty() ? std::string(value_type_name(type)) : type_name;
  j["value"] = typed_to_json(to_typed_value(type, type_name, value, metadata));
  j["meta"] = metadata;
  // Log strings are not guaranteed to be valid UTF-8.
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

JsonLineSink::JsonLineSink(std::string table, std::size_t max_buffer_bytes)
  : table_(std::move(table)), max_buffer_(max_buffer_bytes) {}

JsonLineSink::~JsonLineSink() {
  std::lock_guard<std::mutex> lk(mu_);
  close_();
}

void JsonLineSink::set_server(const std::string& host, int port) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  const std::string service = std::to_string(port);
  const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
  if (rc != 0 || !res) {
    throw std::runtime_error("cannot resolve " + host + ": " + ::gai_strerror(rc));
  }

  std::lock_guard<std::mutex> lk(mu_);
  close_();
  std::memcpy(&addr_, res->ai_addr, res->ai_addrlen);
  addr_len_ = static_cast<socklen_t>(res->ai_addrlen);
  ::freeaddrinfo(res);
  has_target_ = true;
  out_.clear();
  next_attempt_ = clock::time_point{};
  ensure_connected_(clock::now());
}

void JsonLineSink::put(const std::string& key,
                       ValueType type,
                       const std::string& type_name,
                       const std::string& value,
                       const std::string& metadata) {
  std::string line = encode_json_line(table_, key, type, type_name, value, metadata);
  line.push_back('\n');

  std::lock_guard<std::mutex> lk(mu_);
  if (!has_target_) return;
  out_ += line;
  trim_buffer_();
}

void JsonLineSink::flush() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!has_target_ || out_.empty()) return;
  if (!ensure_connected_(clock::now())) return;

  while (!out_.empty()) {
    const ssize_t n = ::send(fd_, out_.data(), out_.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
    if (n > 0) {
      head_partial_ = out_[static_cast<std::size_t>(n) - 1] != '\n';
      out_.erase(0, static_cast<std::size_t>(n));
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) return;
    log::warn("sink send failed", {log::str("error", std::strerror(errno))});
    close_();
    next_attempt_ = clock::now() + kRetryInterval;
    return;
  }
}

bool JsonLineSink::connected() const {
  std::lock_guard<std::mutex> lk(mu_);
  return fd_ >= 0 && !connecting_;
}

std::size_t JsonLineSink::pending_bytes() const {
  std::lock_guard<std::mutex> lk(mu_);
  return out_.size();
}

void JsonLineSink::close_() {
  if (fd_ >= 0) ::close(fd_);
  fd_ = -1;
  connecting_ = false;
  // The rest of a half-sent line would start mid-object on the next connection.
  if (head_partial_) {
    const std::size_t nl = out_.find('\n');
    out_.erase(0, nl == std::string::npos ? out_.size() : nl + 1);
    head_partial_ = false;
  }
}

// Caller holds mu_. True once the socket is writable.
bool JsonLineSink::ensure_connected_(clock::time_point now) {
  if (fd_ >= 0 && !connecting_) return true;

  if (fd_ < 0) {
    if (now < next_attempt_) return false;
    next_attempt_ = now + kRetryInterval;
    fd_ = ::socket(addr_.ss_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
      log::warn("sink socket failed", {log::str("error", std::strerror(errno))});
      return false;
    }
    const int rc = ::connect(fd_, reinterpret_cast<const sockaddr*>(&addr_), addr_len_);
    if (rc == 0) {
      connecting_ = false;
      log::info("sink connected");
      return true;
    }
    if (errno != EINPROGRESS) {
      log::debug("sink connect failed", {log::str("error", std::strerror(errno))});
      close_();
      return false;
    }
    connecting_ = true;
  }

  pollfd pfd{fd_, POLLOUT, 0};
  const int ready = ::poll(&pfd, 1, 0);
  if (ready <= 0) return false;

  int err = 0;
  socklen_t len = sizeof(err);
  if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len) < 0 || err != 0) {
    log::debug("sink connect failed", {log::str("error", std::strerror(err ? err : errno))});
    close_();
    return false;
  }
  connecting_ = false;
  log::info("sink connected");
  return true;
}

void JsonLineSink::trim_buffer_() {
  if (out_.size() <= max_buffer_) return;
  // Drop whole lines from the front, keeping a half-sent head line intact.
  const std::size_t keep = head_partial_ ? out_.find('\n') + 1 : 0;
  const std::size_t excess = out_.size() - max_buffer_;
  std::size_t cut = out_.find('\n', keep + excess - 1);
  cut = (cut == std::string::npos) ? out_.size() : cut + 1;
  if (cut > keep) out_.erase(keep, cut - keep);
}

} // namespace lrp
