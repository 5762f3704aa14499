#include "ucicodec/uci.hpp"
#include "ucicodec/message.hpp"

#include <iostream>
#include <string>

namespace ucicodec {

// ------------ helpers ------------
static std::string join_tokens(const Tokens& toks) {
  std::string s;
  for (const auto& t : toks) {
    if (!s.empty()) s.push_back(' ');
    s += t;
  }
  return s;
}

static void send(std::ostream& out, const std::string& msg) {
  out << msg << '\n';
}

// uci: identify, advertise options, then uciok
static void handle_uci(CommandHandler& h, std::ostream& out, const DriverConfig& cfg) {
  send(out, build_name_msg(cfg.name));
  send(out, build_author_msg(cfg.author));
  for (const auto& opt : cfg.options) send(out, build_option_msg(opt));
  h.on_uci(out);
  send(out, build_uci_ok_msg());
}

// ------------ dispatch ------------
bool dispatch_line(std::string_view line, CommandHandler& h,
                   std::ostream& out, DriverConfig& cfg) {
  const Command cmd = Command::from_line(line);
  const auto type = cmd.type();
  if (!type) return true; // empty or unknown command: ignored per UCI

  if (cfg.debug && cfg.log) *cfg.log << "[uci] " << join_tokens(cmd.tokens()) << '\n';

  try {
    switch (*type) {
      case CommandType::Uci:
        parse_uci(cmd);
        handle_uci(h, out, cfg);
        break;
      case CommandType::Debug:
        cfg.debug = parse_debug(cmd);
        h.on_debug(cfg.debug, out);
        break;
      case CommandType::IsReady:
        parse_isready(cmd);
        h.on_isready(out);
        send(out, build_ready_ok_msg());
        break;
      case CommandType::SetOption:
        h.on_setoption(parse_setoption(cmd), out);
        break;
      case CommandType::UciNewGame:
        parse_ucinewgame(cmd);
        h.on_ucinewgame(out);
        break;
      case CommandType::Position:
        h.on_position(parse_position(cmd), out);
        break;
      case CommandType::Go:
        h.on_go(parse_go(cmd), out);
        break;
      case CommandType::Stop:
        parse_stop(cmd);
        h.on_stop(out);
        break;
      case CommandType::Quit:
        parse_quit(cmd);
        h.on_quit();
        return false;
    }
  } catch (const ParsingError& e) {
    if (cfg.log) *cfg.log << "[uci] " << command_name(*type) << ": " << e.what() << '\n';
  }
  return true;
}

// ------------ loop ------------
void uci_loop(std::istream& in, std::ostream& out, CommandHandler& h, DriverConfig& cfg) {
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    const bool keepGoing = dispatch_line(line, h, out, cfg);
    out.flush();
    if (!keepGoing) break;
  }
}

} // namespace ucicodec
