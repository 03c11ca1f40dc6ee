#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <lrp/config.hpp>
#include <lrp/control_channel.hpp>
#include <lrp/json_line_sink.hpp>
#include <lrp/logging.hpp>
#include <lrp/replay_context.hpp>

using namespace lrp;

static void usage(const char* argv0) {
  std::cerr << "usage: " << argv0 << " [--config file.yaml]\n"
            << "Reads playback commands on stdin, answers on stdout.\n";
}

int main(int argc, char** argv) {
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      usage(argv[0]);
      return 0;
    } else {
      usage(argv[0]);
      return 2;
    }
  }

  Config cfg;
  try {
    if (!config_path.empty()) cfg = load_config(config_path);
  } catch (const ConfigError& e) {
    log::init(cfg.logging);
    log::error("startup failed", {log::str("error", e.what())});
    log::shutdown();
    return 2;
  }
  log::init(cfg.logging);

  auto sink = std::make_unique<JsonLineSink>(cfg.sink.table);
  if (cfg.sink.connect) {
    try {
      sink->set_server(cfg.sink.host, cfg.sink.port);
    } catch (const std::exception& e) {
      log::warn("initial sink target rejected", {log::str("error", e.what())});
    }
  }

  ReplayContext ctx(cfg, std::move(sink));
  ctx.scheduler().start();
  log::info("publisher ready", {log::num("period_ms", cfg.playback.period_ms)});

  ControlChannel channel(ctx);
  const std::size_t handled = channel.serve(std::cin, std::cout);

  ctx.scheduler().stop_thread();
  log::info("publisher exiting", {log::num("commands", handled)});
  log::shutdown();
  return 0;
}
