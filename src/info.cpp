#include "ucicodec/info.hpp"

#include <type_traits>

namespace ucicodec {

// ------------ helpers ------------
static void append_line(std::string& msg, const std::vector<std::string>& line) {
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (i) msg.push_back(' ');
    msg += line[i];
  }
}

static void append_num(std::string& msg, const char* key, std::uint64_t v) {
  msg.push_back(' ');
  msg += key;
  msg.push_back(' ');
  msg += std::to_string(v);
}

static void append_score(std::string& msg, const info::ScoreInfo& s) {
  msg += (s.score.kind == Score::Kind::Cp ? " score cp " : " score mate ");
  msg += std::to_string(s.score.value);
  if (s.lowerbound) msg += " lowerbound";
  if (s.upperbound) msg += " upperbound";
}

// ------------ info builder ------------
std::string build_info_msg(const std::vector<MoveInfo>& entries) {
  std::string msg = "info";
  const std::string* custom = nullptr;

  for (const auto& entry : entries) {
    std::visit([&](const auto& e) {
      using T = std::decay_t<decltype(e)>;
      if constexpr (std::is_same_v<T, info::Depth>)               append_num(msg, "depth", e.plies);
      else if constexpr (std::is_same_v<T, info::SelDepth>)       append_num(msg, "seldepth", e.plies);
      else if constexpr (std::is_same_v<T, info::Time>)           append_num(msg, "time", e.ms);
      else if constexpr (std::is_same_v<T, info::Nodes>)          append_num(msg, "nodes", e.count);
      else if constexpr (std::is_same_v<T, info::CurrMoveNumber>) append_num(msg, "currmovenumber", e.index);
      else if constexpr (std::is_same_v<T, info::HashFull>)       append_num(msg, "hashfull", e.permille);
      else if constexpr (std::is_same_v<T, info::Nps>)            append_num(msg, "nps", e.value);
      else if constexpr (std::is_same_v<T, info::TbHits>)         append_num(msg, "tbhits", e.count);
      else if constexpr (std::is_same_v<T, info::CpuLoad>)        append_num(msg, "cpuload", e.permille);
      else if constexpr (std::is_same_v<T, info::MultiPv>)        append_num(msg, "multipv", e.index);
      else if constexpr (std::is_same_v<T, info::ScoreInfo>)      append_score(msg, e);
      else if constexpr (std::is_same_v<T, info::CurrMove>) {
        msg += " currmove ";
        msg += e.move;
      } else if constexpr (std::is_same_v<T, info::Pv>) {
        msg += " pv ";
        append_line(msg, e.line);
      } else if constexpr (std::is_same_v<T, info::Refutation>) {
        msg += " refutation ";
        append_line(msg, e.line);
      } else if constexpr (std::is_same_v<T, info::CurrLine>) {
        append_num(msg, "currline", e.task);
        msg.push_back(' ');
        append_line(msg, e.line);
      } else {
        static_assert(std::is_same_v<T, info::Custom>);
        custom = &e.text;     // deferred: "string" must be the last field
      }
    }, entry);
  }

  if (custom) {
    msg += " string ";
    msg += *custom;
  }
  return msg;
}

} // namespace ucicodec
