#include <lrp/scheduler.hpp>
#include <algorithm>
#include <cmath>
#include <exception>
#include <lrp/logging.hpp>

namespace lrp {

static std::chrono::nanoseconds seconds_to_ns(double s) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::duration<double>(s));
}

// Seek clamp; unvalidated configs fall back to the hard limit.
static double cutoff_or_limit(double max_s) {
  if (!(max_s > 0.0) || max_s > kMaxTimestampLimitS) return kMaxTimestampLimitS;
  return max_s;
}

PlaybackScheduler::PlaybackScheduler(Sink& sink, PlaybackConfig cfg, NowFn now)
  : sink_(sink),
    period_(std::chrono::milliseconds(cfg.period_ms > 0 ? cfg.period_ms : 20)),
    period_s_(std::chrono::duration<double>(period_).count()),
    max_timestamp_s_(cutoff_or_limit(cfg.max_timestamp_s)),
    now_(std::move(now)) {
  const auto t = now_();
  st_.origin = t;
  next_wake_ = t;
}

// ---- control surface -------------------------------------------------------

void PlaybackScheduler::load(FrameArray frames) {
  auto shared = std::make_shared<const FrameArray>(std::move(frames));
  const std::size_t n = shared->size();
  const auto t = now_();
  {
    std::lock_guard<std::mutex> lk(mu_);
    st_.frames = std::move(shared);
    st_.idx = 0;
    st_.playing = false;
    st_.origin = t;
    ++st_.version;
    ++st_.generation;
  }
  log::debug("frames loaded", {log::num("frames", n)});
}

void PlaybackScheduler::seek(double t_s) {
  if (std::isnan(t_s)) t_s = 0.0;
  t_s = std::clamp(t_s, 0.0, max_timestamp_s_);
  const auto t = now_();
  std::size_t idx = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    idx = static_cast<std::size_t>(std::floor(t_s / period_s_));
    st_.idx = idx;
    st_.origin = t - seconds_to_ns(t_s);
    ++st_.version;
  }
  log::debug("seek", {log::real("t_s", t_s), log::num("frame", idx)});
}

void PlaybackScheduler::play() {
  const auto t = now_();
  std::size_t idx = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (st_.playing) return;
    idx = st_.idx;
    st_.origin = t - period_ * static_cast<std::int64_t>(idx);
    st_.playing = true;
    ++st_.version;
  }
  log::debug("play", {log::num("frame", idx)});
}

void PlaybackScheduler::pause() {
  std::size_t idx = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    st_.playing = false;
    idx = st_.idx;
    ++st_.version;
  }
  log::debug("pause", {log::num("frame", idx)});
}

void PlaybackScheduler::stop() {
  const auto t = now_();
  {
    std::lock_guard<std::mutex> lk(mu_);
    st_.playing = false;
    st_.idx = 0;
    st_.origin = t;
    ++st_.version;
  }
  log::debug("stop");
}

void PlaybackScheduler::set_publishing(bool on) {
  std::lock_guard<std::mutex> lk(mu_);
  st_.publishing = on;
}

PlaybackPosition PlaybackScheduler::position() const {
  std::lock_guard<std::mutex> lk(mu_);
  PlaybackPosition p;
  p.frame_index = st_.idx;
  p.frame_count = st_.frames ? st_.frames->size() : 0;
  p.playing = st_.playing;
  p.publishing = st_.publishing;
  return p;
}

// ---- timing loop -----------------------------------------------------------

void PlaybackScheduler::start() {
  if (running_.load()) return;
  next_wake_ = now_();
  running_.store(true);
  th_ = std::thread(&PlaybackScheduler::thread_main_, this);
}

void PlaybackScheduler::stop_thread() {
  {
    std::lock_guard<std::mutex> lk(sleep_mu_);
    if (!running_.load()) return;
    running_.store(false);
  }
  sleep_cv_.notify_all();
  if (th_.joinable()) th_.join();
}

void PlaybackScheduler::thread_main_() {
  while (running_.load(std::memory_order_relaxed)) {
    {
      std::unique_lock<std::mutex> lk(sleep_mu_);
      if (sleep_cv_.wait_until(lk, next_wake_, [this] { return !running_.load(); })) break;
    }
    tick(now_());
  }
}

void PlaybackScheduler::tick(clock::time_point now) {
  State s;
  {
    std::lock_guard<std::mutex> lk(mu_);
    s = st_;
  }

  if (s.generation != seen_generation_) {
    seen_generation_ = s.generation;
    prev_owner_.reset();
    prev_ = nullptr;
    failed_keys_.clear();
  }

  if (s.playing && s.frames && !s.frames->empty()) {
    const std::size_t n = s.frames->size();
    const auto elapsed = now - s.origin;
    std::size_t target = 0;
    if (elapsed.count() > 0) {
      target = std::min<std::size_t>(static_cast<std::size_t>(elapsed / period_), n - 1);
    }

    std::size_t idx = s.idx;
    while (idx <= target) {
      if (s.publishing) emit_(s.frames, idx);
      ++idx;
    }

    bool ended = false;
    {
      std::lock_guard<std::mutex> lk(mu_);
      // A control operation that landed during emission wins.
      if (st_.version == s.version) {
        st_.idx = idx;
        if (st_.idx >= n && st_.playing) {
          st_.playing = false;
          ++st_.version;
          ended = true;
        }
      }
    }
    if (ended) log::debug("end of log reached", {log::num("frames", n)});
  }

  next_wake_ += period_;
  const auto behind = now - next_wake_;
  if (behind > period_) {
    // Skip the missed ticks instead of replaying each one.
    next_wake_ += period_ * (behind / period_ + 1);
  }
}

void PlaybackScheduler::emit_(const std::shared_ptr<const FrameArray>& frames, std::size_t idx) {
  const Frame& frame = (*frames)[idx];
  for (const auto& [key, value] : frame) {
    if (prev_) {
      auto it = prev_->find(key);
      if (it != prev_->end() && it->second == value) continue;
    }
    put_(key, value);
  }
  prev_owner_ = frames;
  prev_ = &frame;

  try {
    sink_.flush();
  } catch (const std::exception& e) {
    log::warn("sink flush failed", {log::str("error", e.what())});
  }
}

void PlaybackScheduler::put_(const std::string& key, const FrameValue& v) {
  try {
    sink_.put(key, v.type, v.type_name, v.value, v.metadata);
  } catch (const std::exception& e) {
    if (failed_keys_.insert(key).second) {
      log::warn("sink put failed", {log::str("key", key), log::str("error", e.what())});
    }
  }
}

} // namespace lrp
