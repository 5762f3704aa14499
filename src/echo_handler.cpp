#include "ucicodec/echo_handler.hpp"
#include "ucicodec/message.hpp"

#include <ostream>
#include <string>

namespace ucicodec {

void EchoHandler::on_position(const PositionPayload& pos, std::ostream& out) {
  std::string text = "position " + pos.fen;
  if (!pos.moves.empty()) text += " +" + std::to_string(pos.moves.size()) + " moves";
  out << build_info_msg({info::Custom{text}}) << '\n';
}

void EchoHandler::on_go(const GoPayload& go, std::ostream& out) {
  out << build_info_msg({info::Depth{0},
                         info::Time{go.movetime},
                         info::Custom{go.infinite ? "infinite" : "timed"}}) << '\n';
  out << build_bestmove_msg("0000") << '\n';
}

} // namespace ucicodec
