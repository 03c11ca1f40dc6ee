#include <catch2/catch.hpp>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <lrp/json_line_sink.hpp>

using Catch::Detail::Approx;
using namespace lrp;
using json = nlohmann::json;

namespace {

// Loopback listener on an ephemeral port.
struct Listener {
  int fd = -1;
  int port = 0;

  Listener() {
    fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::listen(fd, 4);
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    port = ntohs(addr.sin_port);
  }
  ~Listener() { if (fd >= 0) ::close(fd); }
};

std::vector<std::string> read_lines(int fd, std::size_t count) {
  timeval tv{2, 0};
  ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  std::string buf;
  char chunk[512];
  std::vector<std::string> lines;
  while (lines.size() < count) {
    const ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
    if (n <= 0) break;
    buf.append(chunk, static_cast<std::size_t>(n));
    std::size_t nl;
    while ((nl = buf.find('\n')) != std::string::npos) {
      lines.push_back(buf.substr(0, nl));
      buf.erase(0, nl + 1);
    }
  }
  return lines;
}

} // namespace

TEST_CASE("encode_json_line carries typed values") {
  auto d = json::parse(encode_json_line("Replay", "speed", ValueType::Double, "double", "1.5", "{}"));
  REQUIRE(d["key"] == "Replay/speed");
  REQUIRE(d["type"] == "double");
  REQUIRE(d["value"].get<double>() == Approx(1.5));
  REQUIRE(d["meta"] == "{}");

  auto b = json::parse(encode_json_line("", "DS:enabled", ValueType::Boolean, "boolean", "True", ""));
  REQUIRE(b["key"] == "DS:enabled");
  REQUIRE(b["value"] == true);

  auto i = json::parse(encode_json_line("T", "n", ValueType::Int64, "int64", "-7", ""));
  REQUIRE(i["value"].get<double>() == Approx(-7.0));

  auto sa = json::parse(encode_json_line("T", "cams", ValueType::StringArray, "string[]", "front,back", ""));
  REQUIRE(sa["value"] == json::array({"front", "back"}));

  auto ba = json::parse(encode_json_line("T", "bits", ValueType::BooleanArray, "boolean[]", "True,False", ""));
  REQUIRE(ba["value"] == json::array({true, false}));
}

TEST_CASE("raw values encode as hex with their type tag") {
  auto r = json::parse(encode_json_line("T", "pose", ValueType::Raw, "raw", "0a0b",
                                        R"({"type":"struct:Pose2d"})"));
  REQUIRE(r["type"] == "raw");
  REQUIRE(r["value"]["bytes"] == "0a0b");
  REQUIRE(r["value"]["type"] == "struct:Pose2d");
}

TEST_CASE("invalid UTF-8 text does not break encoding") {
  const std::string bad = "ok\xff";
  const std::string line = encode_json_line("T", "s", ValueType::String, "string", bad, "");
  REQUIRE(line.find('\n') == std::string::npos);
  REQUIRE_NOTHROW(json::parse(line));
}

TEST_CASE("put without a target is a no-op") {
  JsonLineSink sink;
  sink.put("a", ValueType::Double, "double", "1", "");
  sink.flush();
  REQUIRE(sink.pending_bytes() == 0);
  REQUIRE_FALSE(sink.connected());
}

TEST_CASE("unresolvable host throws") {
  JsonLineSink sink;
  REQUIRE_THROWS(sink.set_server("no such host name", 5810));
}

TEST_CASE("buffer stays capped while the target is unreachable") {
  int dead_port = 0;
  {
    Listener tmp;
    dead_port = tmp.port;
  }
  JsonLineSink sink("Replay", 256);
  sink.set_server("127.0.0.1", dead_port);
  for (int i = 0; i < 50; ++i) {
    sink.put("key" + std::to_string(i), ValueType::Double, "double", std::to_string(i), "");
  }
  sink.flush();
  REQUIRE(sink.pending_bytes() > 0);
  REQUIRE(sink.pending_bytes() <= 256);
  REQUIRE_FALSE(sink.connected());
}

TEST_CASE("lines reach a listening peer in order") {
  Listener listener;
  JsonLineSink sink("Replay");
  sink.set_server("127.0.0.1", listener.port);
  sink.put("a", ValueType::Double, "double", "1", "");
  sink.put("b", ValueType::String, "string", "two", "");

  for (int i = 0; i < 200 && sink.pending_bytes() > 0; ++i) {
    sink.flush();
    if (sink.pending_bytes() > 0) std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  REQUIRE(sink.pending_bytes() == 0);
  REQUIRE(sink.connected());

  const int peer = ::accept(listener.fd, nullptr, nullptr);
  REQUIRE(peer >= 0);
  const auto lines = read_lines(peer, 2);
  ::close(peer);

  REQUIRE(lines.size() == 2);
  REQUIRE(json::parse(lines[0])["key"] == "Replay/a");
  REQUIRE(json::parse(lines[1])["value"] == "two");
}
