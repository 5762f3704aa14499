#include "ucicodec/parse.hpp"
#include "ucicodec/notation.hpp"

#include <algorithm>

namespace ucicodec {

static std::string join_range(const Tokens& toks, std::size_t start, std::size_t end) {
  std::string s;
  for (std::size_t i = start; i < end; ++i) {
    if (!s.empty()) s.push_back(' ');
    s += toks[i];
  }
  return s;
}

// Parse:
//   position startpos [moves ...]
//   position fen <FEN...> [moves ...]
PositionPayload parse_position(const Tokens& tokens) {
  if (tokens.size() < 2)
    throw ParsingError(InvalidLength{2, UNBOUNDED, tokens.size()});
  if (tokens[0] != "position")
    throw ParsingError(InvalidCommandType{"position", tokens[0]});

  // FEN segment: tokens[1, movesIdx)
  const auto movesIt = std::find(tokens.begin() + 1, tokens.end(), "moves");
  const std::size_t movesIdx = static_cast<std::size_t>(movesIt - tokens.begin());
  const std::size_t fenLen = movesIdx - 1;

  PositionPayload p;
  if (fenLen == 1) {
    p.fen = (tokens[1] == "startpos") ? std::string(STARTPOS_FEN) : tokens[1];
  } else if (fenLen == 7) {
    // tokens[1] is the "fen" keyword
    p.fen = join_range(tokens, 2, movesIdx);
  } else {
    throw ParsingError(InvalidLength{7, 7, fenLen});
  }

  if (!is_valid_fen(p.fen)) throw ParsingError(UnknownToken{p.fen});

  // Moves segment, without its "moves" marker
  for (std::size_t i = movesIdx + 1; i < tokens.size(); ++i) {
    if (!is_valid_move(tokens[i])) throw ParsingError(UnknownToken{tokens[i]});
    p.moves.push_back(tokens[i]);
  }
  return p;
}

} // namespace ucicodec
