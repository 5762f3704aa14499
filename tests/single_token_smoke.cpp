#include <cassert>

#include "ucicodec/parse.hpp"
#include "expect_error.hpp"

using namespace ucicodec;
using namespace ucicodec::test;

int main() {
  // Accepted
  {
    parse_uci(tokenize("uci"));
    parse_isready(tokenize("isready"));
    parse_ucinewgame(tokenize("ucinewgame"));
    parse_stop(tokenize("  stop \n"));
    parse_quit(Tokens{"quit"});
    parse_quit(Command::from_line("quit"));
  }
  // Extra tokens, including a second line glued on
  {
    auto d = expect_detail<InvalidLength>([] { parse_quit(Tokens{"quit", "x"}); });
    assert((d == InvalidLength{1, 1, 2}));

    d = expect_detail<InvalidLength>([] { parse_isready(tokenize("isready\nisready")); });
    assert(d.got == 2);

    d = expect_detail<InvalidLength>([] { parse_uci(Tokens{}); });
    assert((d == InvalidLength{1, 1, 0}));
  }
  // Wrong literal
  {
    auto d = expect_detail<InvalidCommandType>([] { parse_quit(Tokens{"stop"}); });
    assert((d == InvalidCommandType{"quit", "stop"}));

    d = expect_detail<InvalidCommandType>([] { parse_uci(tokenize("icu")); });
    assert((d == InvalidCommandType{"uci", "icu"}));

    d = expect_detail<InvalidCommandType>([] { parse_ucinewgame(tokenize("unknown")); });
    assert(d.expected == "ucinewgame");
  }
  // Shared helper
  {
    parse_single_token(Tokens{"ping"}, "ping");
    auto d = expect_detail<InvalidCommandType>([] { parse_single_token(Tokens{"pong"}, "ping"); });
    assert(d.got == "pong");
  }
  return 0;
}
