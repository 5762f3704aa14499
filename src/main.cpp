#include <iostream>
#include <string>
#include <vector>

#include "ucicodec/command.hpp"
#include "ucicodec/error.hpp"
#include "ucicodec/parse.hpp"

using namespace ucicodec;

static void usage() {
  std::cout <<
    "UciCodec CLI\n"
    "Usage:\n"
    "  ucicodec_cli tokenize <line...>\n"
    "  ucicodec_cli classify <line...>\n"
    "  ucicodec_cli check <line...>\n"
    "The line may be passed as one quoted argument or as separate words.\n";
}

static std::string join_from(const std::vector<std::string>& a, size_t i) {
  std::string s;
  for (size_t k = i; k < a.size(); ++k) {
    if (k > i) s.push_back(' ');
    s += a[k];
  }
  return s;
}

// Run the parser matching the command type; throws ParsingError.
static void check_command(const Command& cmd, CommandType type) {
  switch (type) {
    case CommandType::Uci:        parse_uci(cmd); break;
    case CommandType::Debug:      (void)parse_debug(cmd); break;
    case CommandType::IsReady:    parse_isready(cmd); break;
    case CommandType::SetOption:  (void)parse_setoption(cmd); break;
    case CommandType::UciNewGame: parse_ucinewgame(cmd); break;
    case CommandType::Position:   (void)parse_position(cmd); break;
    case CommandType::Go:         (void)parse_go(cmd); break;
    case CommandType::Stop:       parse_stop(cmd); break;
    case CommandType::Quit:       parse_quit(cmd); break;
  }
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty()) { usage(); return 0; }

  const std::string cmd = args[0];
  const Command line = Command::from_line(join_from(args, 1));

  // tokenize <line...>
  if (cmd == "tokenize") {
    for (const auto& t : line.tokens()) std::cout << t << "\n";
    return 0;
  }

  // classify <line...>
  if (cmd == "classify") {
    const auto type = line.type();
    std::cout << (type ? command_name(*type) : "none") << "\n";
    return type ? 0 : 1;
  }

  // check <line...>
  if (cmd == "check") {
    const auto type = line.type();
    if (!type) { std::cout << "none\n"; return 1; }
    try {
      check_command(line, *type);
    } catch (const ParsingError& e) {
      std::cout << e.what() << "\n";
      return 1;
    }
    std::cout << "ok\n";
    return 0;
  }

  usage();
  return 1;
}
