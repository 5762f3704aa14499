#include "ucicodec/error.hpp"

#include <type_traits>
#include <utility>

namespace ucicodec {

std::string describe(const ParsingError::Detail& d) {
  return std::visit([](const auto& e) -> std::string {
    using T = std::decay_t<decltype(e)>;
    if constexpr (std::is_same_v<T, InvalidCommandType>) {
      return "Invalid command type. Expected " + e.expected + ", got " + e.got;
    } else if constexpr (std::is_same_v<T, InvalidLength>) {
      return "Invalid length. Expected between " + std::to_string(e.min) +
             " and " + std::to_string(e.max) + ", got " + std::to_string(e.got);
    } else {
      return "Unknown token '" + e.token + "'";
    }
  }, d);
}

ParsingError::ParsingError(InvalidCommandType e)
  : std::runtime_error(describe(Detail{e})), detail_(std::move(e)) {}

ParsingError::ParsingError(InvalidLength e)
  : std::runtime_error(describe(Detail{e})), detail_(e) {}

ParsingError::ParsingError(UnknownToken e)
  : std::runtime_error(describe(Detail{e})), detail_(std::move(e)) {}

} // namespace ucicodec
