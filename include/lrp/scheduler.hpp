#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <lrp/config.hpp>
#include <lrp/frames.hpp>
#include <lrp/sink.hpp>

namespace lrp {

struct PlaybackPosition {
  std::size_t frame_index = 0;
  std::size_t frame_count = 0;
  bool playing = false;
  bool publishing = false;
};

// Owns replay position and the timing loop that walks frames in step with
// the clock, writing changed keys to the sink.
//
// Control operations (load/seek/play/pause/stop/set_publishing) may be called
// from any thread. All position fields sit behind one mutex; the frame array
// is immutable once loaded and is swapped by pointer under that mutex, so the
// loop reads frames without holding it. The loop emits outside the lock and
// commits its advanced index only if no control operation landed meanwhile.
class PlaybackScheduler {
public:
  using clock = std::chrono::steady_clock;
  using NowFn = std::function<clock::time_point()>;

  explicit PlaybackScheduler(Sink& sink, PlaybackConfig cfg = {}, NowFn now = &clock::now);
  ~PlaybackScheduler() { stop_thread(); }
  PlaybackScheduler(const PlaybackScheduler&) = delete;
  PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;

  // Control surface
  void load(FrameArray frames);        // Stopped(0), previous emission state forgotten
  void seek(double t_s);               // clamps to [0, max_timestamp_s]; keeps play state
  void play();
  void pause();
  void stop();                         // Stopped(0)
  void set_publishing(bool on);

  PlaybackPosition position() const;
  std::chrono::nanoseconds period() const { return period_; }

  // Timing loop thread.
  void start();
  void stop_thread();
  bool running() const { return running_.load(std::memory_order_relaxed); }

  // One loop iteration at `now`: catch up to the frame due, then advance the
  // wake deadline. The thread calls this after sleeping until next_wake().
  void tick(clock::time_point now);
  clock::time_point next_wake() const { return next_wake_; }
  void reset_wake(clock::time_point t) { next_wake_ = t; }

private:
  struct State {
    std::shared_ptr<const FrameArray> frames;
    std::size_t idx = 0;
    bool playing = false;
    bool publishing = false;
    clock::time_point origin{};
    std::uint64_t version = 0;     // bumped by every position-changing operation
    std::uint64_t generation = 0;  // bumped by load()
  };

  void thread_main_();
  void emit_(const std::shared_ptr<const FrameArray>& frames, std::size_t idx);
  void put_(const std::string& key, const FrameValue& v);

  Sink& sink_;
  const std::chrono::nanoseconds period_;
  const double period_s_;
  const double max_timestamp_s_;
  const NowFn now_;

  mutable std::mutex mu_;
  State st_;

  // Loop-owned (touched only by tick()).
  clock::time_point next_wake_{};
  std::uint64_t seen_generation_{0};
  std::shared_ptr<const FrameArray> prev_owner_;
  const Frame* prev_{nullptr};
  std::unordered_set<std::string> failed_keys_; // warned once per load

  std::thread th_;
  std::atomic<bool> running_{false};
  std::mutex sleep_mu_;
  std::condition_variable sleep_cv_;
};

} // namespace lrp
