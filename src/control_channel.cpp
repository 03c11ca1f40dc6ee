#include <lrp/control_channel.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <optional>
#include <sstream>
#include <lrp/logging.hpp>

namespace lrp {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::string unquote(std::string s) {
  if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
    return s.substr(1, s.size() - 2);
  }
  return s;
}

static std::optional<double> parse_double(const std::string& s) {
  if (s.empty()) return std::nullopt;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size() || !std::isfinite(v)) return std::nullopt;
  return v;
}

static std::optional<int> parse_port(const std::string& s) {
  if (s.empty() || s.size() > 5) return std::nullopt;
  if (!std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) return std::nullopt;
  const int v = std::atoi(s.c_str());
  if (v < 1 || v > 65535) return std::nullopt;
  return v;
}

static ControlChannel::Reply ok() { return {"OK"}; }
static ControlChannel::Reply err() { return {"ERR"}; }

ControlChannel::Reply ControlChannel::handle_line(const std::string& line) {
  const std::string cmd = trim(line);
  if (cmd.empty()) return Reply{"", false, true};

  const auto sp = cmd.find_first_of(" \t");
  const std::string verb = cmd.substr(0, sp);
  const std::string args = sp == std::string::npos ? std::string{} : trim(cmd.substr(sp + 1));

  try {
    Reply r = dispatch_(verb, args);
    if (r.line == "ERR") log::info("command rejected", {log::str("command", cmd)});
    return r;
  } catch (const std::exception& e) {
    log::warn("command failed", {log::str("command", cmd), log::str("error", e.what())});
    return err();
  }
}

ControlChannel::Reply ControlChannel::dispatch_(const std::string& verb, const std::string& args) {
  auto& sched = ctx_.scheduler();

  if (verb == "SET_SERVER") {
    std::istringstream ss(args);
    std::string host, port_text, extra;
    if (!(ss >> host >> port_text) || (ss >> extra)) return err();
    const auto port = parse_port(port_text);
    if (!port) return err();
    ctx_.sink().set_server(host, *port);
    log::info("sink target set", {log::str("host", host), log::num("port", *port)});
    return ok();
  }
  if (verb == "LOAD_CSV" || verb == "LOAD_LOG") {
    const std::string path = unquote(args);
    if (path.empty()) return err();
    const bool loaded = verb == "LOAD_CSV" ? ctx_.load_csv(path) : ctx_.load_log(path);
    return loaded ? ok() : err();
  }
  if (verb == "SEEK") {
    const auto t = parse_double(args);
    if (!t) return err();
    sched.seek(*t);
    return ok();
  }
  if (verb == "PLAY")        { sched.play(); return ok(); }
  if (verb == "PAUSE")       { sched.pause(); return ok(); }
  if (verb == "STOP")        { sched.stop(); return ok(); }
  if (verb == "PUBLISH_ON")  { sched.set_publishing(true); return ok(); }
  if (verb == "PUBLISH_OFF") { sched.set_publishing(false); return ok(); }
  if (verb == "STATUS") {
    const auto p = sched.position();
    std::ostringstream ss;
    ss << "OK " << p.frame_index << ' ' << p.frame_count << ' '
       << (p.playing ? 1 : 0) << ' ' << (p.publishing ? 1 : 0);
    return {ss.str()};
  }
  if (verb == "QUIT") return Reply{"BYE", true, false};

  return err();
}

std::size_t ControlChannel::serve(std::istream& in, std::ostream& out) {
  std::size_t handled = 0;
  std::string line;
  while (std::getline(in, line)) {
    Reply r = handle_line(line);
    if (r.silent) continue;
    ++handled;
    out << r.line << '\n' << std::flush;
    if (r.quit) break;
  }
  return handled;
}

} // namespace lrp
