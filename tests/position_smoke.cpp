#include <cassert>
#include <string>

#include "ucicodec/notation.hpp"
#include "ucicodec/parse.hpp"
#include "expect_error.hpp"

using namespace ucicodec;
using namespace ucicodec::test;

int main() {
  const std::string start = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";
  const std::string other = "rnbqkb1r/pppppppp/5n2/8/2PP4/8/PP2PPPP/RNBQKBNR b KQkq c3 0 2";

  // startpos, with and without moves
  {
    auto p = parse_position(tokenize("position startpos"));
    assert(p.fen == start);
    assert(p.fen == STARTPOS_FEN);
    assert(p.moves.empty());

    p = parse_position(tokenize("position startpos moves e2e4 e7e5"));
    assert(p.fen == start);
    assert((p.moves == std::vector<std::string>{"e2e4", "e7e5"}));

    p = parse_position(tokenize("position startpos moves"));
    assert(p.fen == start);
    assert(p.moves.empty());
  }
  // fen with six fields
  {
    auto p = parse_position(tokenize("position fen " + other));
    assert(p.fen == other);
    assert(p.moves.empty());

    p = parse_position(tokenize("position  fen " + other + "  moves e7e5 a2a1q\n"));
    assert(p.fen == other);
    assert((p.moves == std::vector<std::string>{"e7e5", "a2a1q"}));
  }
  // Too short, or a FEN segment of the wrong size
  {
    auto d = expect_detail<InvalidLength>([] { parse_position(tokenize("")); });
    assert((d == InvalidLength{2, UNBOUNDED, 0}));

    d = expect_detail<InvalidLength>([] { parse_position(tokenize("position")); });
    assert(d.got == 1);

    d = expect_detail<InvalidLength>([] { parse_position(tokenize("position fen invalid")); });
    assert((d == InvalidLength{7, 7, 2}));

    d = expect_detail<InvalidLength>([] { parse_position(tokenize("position moves e2e4")); });
    assert((d == InvalidLength{7, 7, 0}));

    d = expect_detail<InvalidLength>([] { parse_position(tokenize("position startpos mves")); });
    assert(d.got == 2);
  }
  // The first token is checked
  {
    auto d = expect_detail<InvalidCommandType>([] { parse_position(tokenize("go startpos")); });
    assert((d == InvalidCommandType{"position", "go"}));
  }
  // Single token other than startpos must itself be a FEN, which it never is
  {
    auto d = expect_detail<UnknownToken>([] { parse_position(tokenize("position strtpos")); });
    assert(d.token == "strtpos");
  }
  // Malformed sixth field
  {
    auto d = expect_detail<UnknownToken>([] {
      parse_position(tokenize("position fen 8/8/8/8/8/8/8/8 w - - 0 x"));
    });
    assert(d.token == "8/8/8/8/8/8/8/8 w - - 0 x");
  }
  // First bad move is reported
  {
    auto d = expect_detail<UnknownToken>([] {
      parse_position(tokenize("position startpos moves e2e4 invalid e7e5x"));
    });
    assert(d.token == "invalid");
  }
  return 0;
}
