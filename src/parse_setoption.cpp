#include "ucicodec/parse.hpp"

namespace ucicodec {

// Parse: setoption name <id> [value <x>]
// Keywords may repeat; the last occurrence wins. Whether the option exists
// is for the engine to decide.
SetOptionPayload parse_setoption(const Tokens& tokens) {
  if (tokens.size() < 3)
    throw ParsingError(InvalidLength{3, UNBOUNDED, tokens.size()});
  if (tokens[0] != "setoption")
    throw ParsingError(InvalidCommandType{"setoption", tokens[0]});

  SetOptionPayload p;
  for (std::size_t i = 1; i < tokens.size(); ++i) {
    const std::string& kw = tokens[i];
    const bool isName = (kw == "name");
    if (!isName && kw != "value") throw ParsingError(UnknownToken{kw});
    if (i + 1 >= tokens.size()) throw ParsingError(UnknownToken{kw});

    (isName ? p.name : p.value) = tokens[++i];
  }
  return p;
}

} // namespace ucicodec
