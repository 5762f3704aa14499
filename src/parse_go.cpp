#include "ucicodec/parse.hpp"

#include <charconv>
#include <system_error>

namespace ucicodec {

// Whole token must be a decimal u64. One leading '+' is allowed when a
// digit follows it; '-' is always rejected.
static bool to_u64(const std::string& s, std::uint64_t& out) {
  if (s.empty()) return false;
  const char* first = s.data();
  const char* last = s.data() + s.size();
  if (*first == '+' && s.size() > 1 && s[1] >= '0' && s[1] <= '9') ++first;
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

// Parse: go [movetime <ms>] [infinite]
// Only these two keywords are accepted; anything else (wtime, depth, ...)
// is a parse failure rather than being skipped.
GoPayload parse_go(const Tokens& tokens) {
  if (tokens.size() < 2)
    throw ParsingError(InvalidLength{2, UNBOUNDED, tokens.size()});
  if (tokens[0] != "go")
    throw ParsingError(InvalidCommandType{"go", tokens[0]});

  GoPayload p;
  for (std::size_t i = 1; i < tokens.size(); ++i) {
    const std::string& t = tokens[i];
    if (t == "infinite") {
      p.infinite = true;
    } else if (t == "movetime") {
      if (i + 1 >= tokens.size()) throw ParsingError(UnknownToken{t});
      const std::string& val = tokens[++i];
      std::uint64_t ms = 0;
      if (!to_u64(val, ms)) throw ParsingError(UnknownToken{val});
      p.movetime = ms;
    } else {
      throw ParsingError(UnknownToken{t});
    }
  }
  return p;
}

} // namespace ucicodec
