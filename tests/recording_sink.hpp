#pragma once
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <lrp/sink.hpp>

namespace lrp::test {

// In-memory sink; records puts grouped per flush.
class RecordingSink : public Sink {
public:
  struct Put {
    std::string key;
    std::string value;
  };

  void set_server(const std::string& host, int port) override {
    std::lock_guard<std::mutex> lk(mu_);
    host_ = host;
    port_ = port;
  }

  void put(const std::string& key, ValueType, const std::string&,
           const std::string& value, const std::string&) override {
    std::lock_guard<std::mutex> lk(mu_);
    if (failing_keys_.count(key)) throw std::runtime_error("put rejected");
    pending_.push_back({key, value});
    puts_.push_back({key, value});
  }

  void flush() override {
    std::lock_guard<std::mutex> lk(mu_);
    batches_.push_back(std::move(pending_));
    pending_.clear();
  }

  void fail_key(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    failing_keys_.insert(key);
  }

  std::vector<Put> puts() const {
    std::lock_guard<std::mutex> lk(mu_);
    return puts_;
  }
  // One entry per emitted frame.
  std::vector<std::vector<Put>> batches() const {
    std::lock_guard<std::mutex> lk(mu_);
    return batches_;
  }
  std::string host() const { std::lock_guard<std::mutex> lk(mu_); return host_; }
  int port() const { std::lock_guard<std::mutex> lk(mu_); return port_; }

private:
  mutable std::mutex mu_;
  std::string host_;
  int port_{0};
  std::set<std::string> failing_keys_;
  std::vector<Put> pending_;
  std::vector<Put> puts_;
  std::vector<std::vector<Put>> batches_;
};

} // namespace lrp::test
