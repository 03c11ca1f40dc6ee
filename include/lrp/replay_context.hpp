#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <lrp/config.hpp>
#include <lrp/sample.hpp>
#include <lrp/scheduler.hpp>
#include <lrp/sink.hpp>
#include <lrp/timeline.hpp>

namespace lrp {

// Everything one playback process owns, constructed once in main() and
// handed to the control channel.
class ReplayContext {
public:
  ReplayContext(Config cfg,
                std::unique_ptr<Sink> sink,
                PlaybackScheduler::NowFn now = &PlaybackScheduler::clock::now);

  const Config& config() const { return config_; }
  Sink& sink() { return *sink_; }
  PlaybackScheduler& scheduler() { return scheduler_; }

  // Decode a file on the calling thread and swap the frames in only once
  // complete. False (prior log left in place) if the file cannot be read.
  bool load_csv(const std::string& path);
  bool load_log(const std::string& path);

  std::vector<TimelineSegment> timeline() const;

private:
  void install_(std::vector<Sample> samples, const std::string& path, const char* kind);

  Config config_;
  std::unique_ptr<Sink> sink_;
  PlaybackScheduler scheduler_;

  mutable std::mutex timeline_mu_;
  std::vector<TimelineSegment> timeline_;
};

} // namespace lrp
