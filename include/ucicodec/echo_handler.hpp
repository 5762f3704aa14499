// include/ucicodec/echo_handler.hpp
#pragma once
#include <iosfwd>

#include "ucicodec/uci.hpp"

namespace ucicodec {

// Stand-in engine: echoes what it received and never thinks.
// `position` is reported as "info string position <fen> [+N moves]";
// `go` gets a depth-0 info line and "bestmove 0000".
class EchoHandler : public CommandHandler {
public:
  void on_position(const PositionPayload& pos, std::ostream& out) override;
  void on_go(const GoPayload& go, std::ostream& out) override;
};

} // namespace ucicodec
