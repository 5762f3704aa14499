// include/ucicodec/option.hpp
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace ucicodec {

enum class OptionType : int { Check = 0, Spin, Combo, Button, String };

// Descriptor of an engine setting, advertised in reply to `uci`.
// Which fields matter depends on `type`; use the factories below.
struct OptionMsg {
  std::string id;
  OptionType type = OptionType::String;
  std::string default_value;
  std::int64_t min = 0;                 // Spin only
  std::int64_t max = 0;                 // Spin only
  std::vector<std::string> vars;        // Combo only

  static OptionMsg check(std::string id, bool def);
  static OptionMsg spin(std::string id, std::string def, std::int64_t min, std::int64_t max);
  static OptionMsg combo(std::string id, std::string def, std::vector<std::string> vars);
  static OptionMsg button(std::string id);
  static OptionMsg string(std::string id, std::string def);

  bool has_default() const { return type != OptionType::Button; }
  bool has_min_max() const { return type == OptionType::Spin; }
  bool has_var() const { return type == OptionType::Combo; }
};

const char* option_type_name(OptionType t);

// "option name <id> type <kind> [default <v>] [min <i> max <j>] [var <v1> ...]"
std::string build_option_msg(const OptionMsg& option);

} // namespace ucicodec
