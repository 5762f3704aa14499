// include/ucicodec/info.hpp
#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace ucicodec {

// Centipawns or moves (not plies) to mate, from the side to move's POV.
struct Score {
  enum class Kind : int { Cp = 0, Mate = 1 };

  Kind kind = Kind::Cp;
  std::int32_t value = 0;

  static Score cp(std::int32_t v) { return Score{Kind::Cp, v}; }
  static Score mate(std::int32_t v) { return Score{Kind::Mate, v}; }

  bool operator==(const Score&) const = default;
};

// One entry per telemetry item of an `info` line.
namespace info {

struct Depth          { std::uint32_t plies = 0; };
struct SelDepth       { std::uint32_t plies = 0; };
struct Time           { std::uint64_t ms = 0; };
struct Nodes          { std::uint64_t count = 0; };
struct Pv             { std::vector<std::string> line; };
struct ScoreInfo {
  Score score{};
  bool lowerbound = false;
  bool upperbound = false;
};
struct CurrMove       { std::string move; };
struct CurrMoveNumber { std::uint32_t index = 0; };   // 1-based, root moves
struct HashFull       { std::uint32_t permille = 0; };
struct Nps            { std::uint64_t value = 0; };
struct TbHits         { std::uint64_t count = 0; };
struct CpuLoad        { std::uint32_t permille = 0; };
// Free text; always rendered last, may contain reserved keywords.
struct Custom         { std::string text; };
// Explored move followed by its refutation line.
struct Refutation     { std::vector<std::string> line; };
struct MultiPv        { std::uint32_t index = 0; };
struct CurrLine {
  std::uint32_t task = 0;
  std::vector<std::string> line;
};

} // namespace info

using MoveInfo = std::variant<
  info::Depth, info::SelDepth, info::Time, info::Nodes, info::Pv, info::ScoreInfo,
  info::CurrMove, info::CurrMoveNumber, info::HashFull, info::Nps, info::TbHits,
  info::CpuLoad, info::Custom, info::Refutation, info::MultiPv, info::CurrLine>;

// "info depth 1 seldepth 2 ... string <text>"
// Entries are rendered in the order given, except Custom which goes last.
std::string build_info_msg(const std::vector<MoveInfo>& entries);

} // namespace ucicodec
