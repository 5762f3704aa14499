// include/ucicodec/uci.hpp
#pragma once
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "ucicodec/option.hpp"
#include "ucicodec/parse.hpp"

namespace ucicodec {

// Receives parsed commands from the dispatcher. Replies go to `out`,
// one message per line. Only position and go have to be handled.
class CommandHandler {
public:
  virtual ~CommandHandler() = default;

  virtual void on_uci(std::ostream& out) { (void)out; }
  virtual void on_debug(bool on, std::ostream& out) { (void)on; (void)out; }
  virtual void on_isready(std::ostream& out) { (void)out; }
  virtual void on_setoption(const SetOptionPayload& opt, std::ostream& out) { (void)opt; (void)out; }
  virtual void on_ucinewgame(std::ostream& out) { (void)out; }
  virtual void on_position(const PositionPayload& pos, std::ostream& out) = 0;
  virtual void on_go(const GoPayload& go, std::ostream& out) = 0;
  virtual void on_stop(std::ostream& out) { (void)out; }
  virtual void on_quit() {}
};

struct DriverConfig {
  std::string name = "UciCodec";
  std::string author = "ucicodec developers";
  std::vector<OptionMsg> options;       // advertised on `uci`, in this order
  bool debug = false;                   // toggled by `debug on|off`
  std::ostream* log = &std::cerr;       // diagnostics; nullptr => silent
};

// Handle one input line. Unknown and empty lines are ignored; malformed
// commands are logged and skipped. Returns false after a valid `quit`.
bool dispatch_line(std::string_view line, CommandHandler& handler,
                   std::ostream& out, DriverConfig& cfg);

// Read lines until EOF or `quit`.
void uci_loop(std::istream& in, std::ostream& out, CommandHandler& handler, DriverConfig& cfg);

} // namespace ucicodec
