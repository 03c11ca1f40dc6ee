#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <lrp/config.hpp>
#include <lrp/interchange.hpp>
#include <lrp/log_codec.hpp>
#include <lrp/logging.hpp>
#include <lrp/projector.hpp>
#include <lrp/timeline.hpp>

using namespace lrp;

// Converts a binary log into the interchange table LOAD_CSV consumes and
// prints the robot-state timeline.
int main(int argc, char** argv) {
  if (argc < 2 || argc > 3) {
    std::cerr << "usage: " << argv[0] << " <input.wpilog> [output.csv]\n";
    return 2;
  }
  log::init(LoggingConfig{});

  const std::string in_path = argv[1];
  std::string out_path = argc == 3 ? argv[2]
                                   : std::filesystem::path(in_path).replace_extension(".csv").string();

  auto buf = read_file_bytes(in_path);
  if (!buf) {
    log::error("cannot read input", {log::str("path", in_path)});
    return 1;
  }
  LogReader reader(*buf);
  if (!reader.valid()) {
    log::error("not a data log", {log::str("path", in_path)});
    return 1;
  }

  ProjectionStats stats;
  const auto samples = project_records(reader, kDefaultMaxTimestampS, &stats);
  if (!save_interchange_csv(out_path, samples)) {
    log::error("cannot write output", {log::str("path", out_path)});
    return 1;
  }
  log::info("converted",
            {log::str("output", out_path), log::num("records", stats.records),
             log::num("samples", samples.size()), log::num("decode_failures", stats.decode_failures)});

  for (const auto& seg : compute_timeline(samples)) {
    std::printf("%10.3f %10.3f  %s\n", seg.start_s, seg.end_s, robot_state_name(seg.state));
  }
  log::shutdown();
  return 0;
}
