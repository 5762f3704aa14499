#include "ucicodec/command.hpp"

#include <array>
#include <cstddef>
#include <sstream>
#include <string>

namespace ucicodec {

namespace {

struct NamedType {
  const char* name;
  CommandType type;
};

// Indexed by CommandType.
constexpr std::array<NamedType, 9> kCommands{{
  {"uci",        CommandType::Uci},
  {"debug",      CommandType::Debug},
  {"isready",    CommandType::IsReady},
  {"setoption",  CommandType::SetOption},
  {"ucinewgame", CommandType::UciNewGame},
  {"position",   CommandType::Position},
  {"go",         CommandType::Go},
  {"stop",       CommandType::Stop},
  {"quit",       CommandType::Quit},
}};

} // namespace

// ------------ tokenization ------------
Tokens tokenize(std::string_view line) {
  std::istringstream iss{std::string(line)};
  Tokens out;
  std::string tok;
  while (iss >> tok) out.push_back(tok);
  return out;
}

// ------------ classification ------------
std::optional<CommandType> classify(const Tokens& tokens) {
  if (tokens.empty()) return std::nullopt;
  const std::string& head = tokens.front();
  for (const auto& c : kCommands) {
    if (head == c.name) return c.type;
  }
  return std::nullopt;
}

const char* command_name(CommandType t) {
  return kCommands[static_cast<std::size_t>(t)].name;
}

} // namespace ucicodec
