// include/ucicodec/notation.hpp
#pragma once
#include <string_view>

namespace ucicodec {

// Standard initial position, substituted for `position startpos`.
inline constexpr char STARTPOS_FEN[] =
  "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

// Structural FEN check: placement, side to move, castling, en passant,
// halfmove clock and fullmove number. Piece counts and legality are not checked.
// Accepts any string; leading whitespace or trailing fields make it invalid.
bool is_valid_fen(std::string_view fen);

// Long algebraic move such as "e2e4" or "a7a8q".
bool is_valid_move(std::string_view move);

} // namespace ucicodec
