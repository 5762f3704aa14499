// include/ucicodec/error.hpp
#pragma once
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <variant>

namespace ucicodec {

// Upper bound used by parsers that accept any number of trailing tokens.
inline constexpr std::size_t UNBOUNDED = std::numeric_limits<std::size_t>::max();

// First token does not match the literal the parser requires.
struct InvalidCommandType {
  std::string expected;
  std::string got;
  bool operator==(const InvalidCommandType&) const = default;
};

// Token count outside [min, max].
struct InvalidLength {
  std::size_t min = 0;
  std::size_t max = 0;
  std::size_t got = 0;
  bool operator==(const InvalidLength&) const = default;
};

// Keyword, argument, move or FEN that fails its local grammar.
struct UnknownToken {
  std::string token;
  bool operator==(const UnknownToken&) const = default;
};

// Order matches the alternatives of ParsingError::Detail.
enum class ParsingErrorKind : int { InvalidCommandType = 0, InvalidLength = 1, UnknownToken = 2 };

class ParsingError : public std::runtime_error {
public:
  using Detail = std::variant<InvalidCommandType, InvalidLength, UnknownToken>;

  explicit ParsingError(InvalidCommandType e);
  explicit ParsingError(InvalidLength e);
  explicit ParsingError(UnknownToken e);

  const Detail& detail() const noexcept { return detail_; }
  ParsingErrorKind kind() const noexcept { return static_cast<ParsingErrorKind>(detail_.index()); }

private:
  Detail detail_;
};

// Human-readable message, the same text what() returns.
std::string describe(const ParsingError::Detail& d);

} // namespace ucicodec
