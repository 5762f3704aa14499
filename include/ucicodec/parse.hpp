// include/ucicodec/parse.hpp
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "ucicodec/command.hpp"
#include "ucicodec/error.hpp"

namespace ucicodec {

// go [movetime <ms>] [infinite]
struct GoPayload {
  std::uint64_t movetime = 0;   // 0 => not given
  bool infinite = false;
};

// setoption name <id> [value <x>]
struct SetOptionPayload {
  std::string name;
  std::string value;            // empty when the value segment is omitted
};

// position {startpos | fen <6 fields>} [moves ...]
struct PositionPayload {
  std::string fen;              // always a full six-field FEN
  std::vector<std::string> moves;
};

// All parsers throw ParsingError on the first violation they find.

// Exactly one token, equal to `literal`.
void parse_single_token(const Tokens& tokens, const char* literal);

void parse_uci(const Tokens& tokens);
void parse_isready(const Tokens& tokens);
void parse_ucinewgame(const Tokens& tokens);
void parse_stop(const Tokens& tokens);
void parse_quit(const Tokens& tokens);

// "debug on" => true, "debug off" => false.
bool parse_debug(const Tokens& tokens);

SetOptionPayload parse_setoption(const Tokens& tokens);
GoPayload parse_go(const Tokens& tokens);
PositionPayload parse_position(const Tokens& tokens);

inline void parse_uci(const Command& c) { parse_uci(c.tokens()); }
inline void parse_isready(const Command& c) { parse_isready(c.tokens()); }
inline void parse_ucinewgame(const Command& c) { parse_ucinewgame(c.tokens()); }
inline void parse_stop(const Command& c) { parse_stop(c.tokens()); }
inline void parse_quit(const Command& c) { parse_quit(c.tokens()); }
inline bool parse_debug(const Command& c) { return parse_debug(c.tokens()); }
inline SetOptionPayload parse_setoption(const Command& c) { return parse_setoption(c.tokens()); }
inline GoPayload parse_go(const Command& c) { return parse_go(c.tokens()); }
inline PositionPayload parse_position(const Command& c) { return parse_position(c.tokens()); }

} // namespace ucicodec
