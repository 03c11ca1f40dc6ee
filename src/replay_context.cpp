#include <lrp/replay_context.hpp>
#include <lrp/frames.hpp>
#include <lrp/interchange.hpp>
#include <lrp/logging.hpp>
#include <lrp/projector.hpp>

namespace lrp {

ReplayContext::ReplayContext(Config cfg, std::unique_ptr<Sink> sink, PlaybackScheduler::NowFn now)
  : config_(std::move(cfg)),
    sink_(std::move(sink)),
    scheduler_(*sink_, config_.playback, std::move(now)) {}

bool ReplayContext::load_csv(const std::string& path) {
  auto samples = load_interchange_csv(path, config_.playback.max_timestamp_s);
  if (!samples) {
    log::warn("cannot open interchange file", {log::str("path", path)});
    return false;
  }
  install_(std::move(*samples), path, "csv");
  return true;
}

bool ReplayContext::load_log(const std::string& path) {
  ProjectionStats stats;
  auto samples = load_log_file(path, config_.playback.max_timestamp_s, &stats);
  if (!samples) {
    log::warn("cannot open log file", {log::str("path", path)});
    return false;
  }
  log::info("log decoded",
            {log::num("records", stats.records), log::num("orphans", stats.orphan_records),
             log::num("decode_failures", stats.decode_failures),
             log::num("ignored_control", stats.ignored_control)});
  install_(std::move(*samples), path, "log");
  return true;
}

std::vector<TimelineSegment> ReplayContext::timeline() const {
  std::lock_guard<std::mutex> lk(timeline_mu_);
  return timeline_;
}

void ReplayContext::install_(std::vector<Sample> samples, const std::string& path, const char* kind) {
  auto segments = compute_timeline(samples);
  const double duration = samples.empty() ? 0.0 : samples.back().timestamp_s;
  const std::size_t count = samples.size();
  FrameArray frames = coalesce_frames(samples, config_.playback.period_s());
  const std::size_t nframes = frames.size();

  scheduler_.load(std::move(frames));
  {
    std::lock_guard<std::mutex> lk(timeline_mu_);
    timeline_ = segments;
  }
  log::info("replay loaded",
            {log::str("kind", kind), log::str("path", path), log::num("samples", count),
             log::num("frames", nframes), log::real("duration_s", duration),
             log::num("segments", segments.size())});
}

} // namespace lrp
