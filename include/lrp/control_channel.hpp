#pragma once
#include <istream>
#include <ostream>
#include <string>
#include <lrp/replay_context.hpp>

namespace lrp {

// Synchronous line protocol driving a ReplayContext. One command per line,
// exactly one response line per command, in order:
//
//   SET_SERVER host port   OK | ERR
//   LOAD_CSV path          OK | ERR   (interchange table)
//   LOAD_LOG path          OK | ERR   (binary log)
//   SEEK seconds           OK | ERR
//   PLAY | PAUSE | STOP    OK
//   PUBLISH_ON | PUBLISH_OFF OK
//   STATUS                 OK <frame> <frames> <playing> <publishing>
//   QUIT                   BYE, then the channel closes
//
// Anything else, or a bad argument, answers ERR and the channel stays usable.
//
// SET_SERVER resolves the host on the calling thread. A numeric address
// answers at once; a host name waits on the system resolver, and commands
// queued behind it wait too. Playback keeps running meanwhile.
class ControlChannel {
public:
  struct Reply {
    std::string line;
    bool quit = false;
    bool silent = false; // blank input, nothing to send
  };

  explicit ControlChannel(ReplayContext& ctx) : ctx_(ctx) {}

  Reply handle_line(const std::string& line);

  // Read commands until QUIT or end of input, flushing each reply.
  // Returns the number of commands handled.
  std::size_t serve(std::istream& in, std::ostream& out);

private:
  Reply dispatch_(const std::string& verb, const std::string& args);

  ReplayContext& ctx_;
};

} // namespace lrp
