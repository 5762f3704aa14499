#include "ucicodec/parse.hpp"

namespace ucicodec {

void parse_single_token(const Tokens& tokens, const char* literal) {
  if (tokens.size() != 1)
    throw ParsingError(InvalidLength{1, 1, tokens.size()});
  if (tokens[0] != literal)
    throw ParsingError(InvalidCommandType{literal, tokens[0]});
}

void parse_uci(const Tokens& tokens)        { parse_single_token(tokens, "uci"); }
void parse_isready(const Tokens& tokens)    { parse_single_token(tokens, "isready"); }
void parse_ucinewgame(const Tokens& tokens) { parse_single_token(tokens, "ucinewgame"); }
void parse_stop(const Tokens& tokens)       { parse_single_token(tokens, "stop"); }
void parse_quit(const Tokens& tokens)       { parse_single_token(tokens, "quit"); }

// debug {on|off}
bool parse_debug(const Tokens& tokens) {
  if (tokens.size() != 2)
    throw ParsingError(InvalidLength{2, 2, tokens.size()});
  if (tokens[0] != "debug")
    throw ParsingError(InvalidCommandType{"debug", tokens[0]});

  if (tokens[1] == "on")  return true;
  if (tokens[1] == "off") return false;
  throw ParsingError(UnknownToken{tokens[1]});
}

} // namespace ucicodec
