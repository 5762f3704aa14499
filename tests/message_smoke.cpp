#include <cassert>
#include <string>

#include "ucicodec/command.hpp"
#include "ucicodec/message.hpp"

using namespace ucicodec;

static std::string head(const std::string& msg) {
  const Tokens t = tokenize(msg);
  return t.empty() ? std::string() : t.front();
}

int main() {
  assert(build_name_msg("Ivy 0.1.0") == "id name Ivy 0.1.0");
  assert(build_author_msg("Ivy Team") == "id author Ivy Team");
  assert(build_uci_ok_msg() == "uciok");
  assert(build_ready_ok_msg() == "readyok");
  assert(build_bestmove_msg("e2e4") == "bestmove e2e4");

  // No line terminator on any message
  assert(build_bestmove_msg("a7a8q").back() == 'q');

  // Leading keyword survives re-tokenization
  assert(head(build_name_msg("X")) == "id");
  assert(head(build_author_msg("Y")) == "id");
  assert(head(build_uci_ok_msg()) == "uciok");
  assert(head(build_ready_ok_msg()) == "readyok");
  assert(head(build_bestmove_msg("e2e4")) == "bestmove");
  assert(head(build_info_msg({info::Custom{"hello"}})) == "info");
  assert(head(build_option_msg(OptionMsg::button("Clear Hash"))) == "option");
  return 0;
}
