// include/ucicodec/command.hpp
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ucicodec {

using Tokens = std::vector<std::string>;

// The subset of UCI commands understood by the parsers.
enum class CommandType : int {
  Uci = 0,
  Debug,
  IsReady,
  SetOption,
  UciNewGame,
  Position,
  Go,
  Stop,
  Quit
};

// Split a line on runs of whitespace. Empty fragments are dropped,
// order is preserved. Never fails.
Tokens tokenize(std::string_view line);

// Classify by the first token (exact, case-sensitive).
// Empty input or an unknown verb gives nullopt; callers ignore those lines.
std::optional<CommandType> classify(const Tokens& tokens);

// Wire keyword of a command type, e.g. "ucinewgame".
const char* command_name(CommandType t);

// One tokenized input line.
class Command {
public:
  Command() = default;
  explicit Command(Tokens tokens) : tokens_(std::move(tokens)) {}

  static Command from_line(std::string_view line) { return Command(tokenize(line)); }

  const Tokens& tokens() const { return tokens_; }
  bool empty() const { return tokens_.empty(); }
  std::optional<CommandType> type() const { return classify(tokens_); }

private:
  Tokens tokens_;
};

} // namespace ucicodec
