#include "ucicodec/option.hpp"

#include <utility>

namespace ucicodec {

OptionMsg OptionMsg::check(std::string id, bool def) {
  OptionMsg o;
  o.id = std::move(id);
  o.type = OptionType::Check;
  o.default_value = def ? "true" : "false";
  return o;
}

OptionMsg OptionMsg::spin(std::string id, std::string def, std::int64_t min, std::int64_t max) {
  OptionMsg o;
  o.id = std::move(id);
  o.type = OptionType::Spin;
  o.default_value = std::move(def);
  o.min = min;
  o.max = max;
  return o;
}

OptionMsg OptionMsg::combo(std::string id, std::string def, std::vector<std::string> vars) {
  OptionMsg o;
  o.id = std::move(id);
  o.type = OptionType::Combo;
  o.default_value = std::move(def);
  o.vars = std::move(vars);
  return o;
}

OptionMsg OptionMsg::button(std::string id) {
  OptionMsg o;
  o.id = std::move(id);
  o.type = OptionType::Button;
  return o;
}

OptionMsg OptionMsg::string(std::string id, std::string def) {
  OptionMsg o;
  o.id = std::move(id);
  o.type = OptionType::String;
  o.default_value = std::move(def);
  return o;
}

const char* option_type_name(OptionType t) {
  switch (t) {
    case OptionType::Check:  return "check";
    case OptionType::Spin:   return "spin";
    case OptionType::Combo:  return "combo";
    case OptionType::Button: return "button";
    case OptionType::String: return "string";
  }
  return "string";
}

std::string build_option_msg(const OptionMsg& o) {
  std::string msg = "option name ";
  msg += o.id;
  msg += " type ";
  msg += option_type_name(o.type);

  if (o.has_default()) {
    msg += " default ";
    msg += o.default_value;
  }

  // min == max means no range was given
  if (o.has_min_max() && o.min != o.max) {
    msg += " min ";
    msg += std::to_string(o.min);
    msg += " max ";
    msg += std::to_string(o.max);
  }

  if (o.has_var() && !o.vars.empty()) {
    msg += " var";
    for (const auto& v : o.vars) {
      msg.push_back(' ');
      msg += v;
    }
  }
  return msg;
}

} // namespace ucicodec
