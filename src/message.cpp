#include "ucicodec/message.hpp"

namespace ucicodec {

std::string build_name_msg(std::string_view name) {
  std::string s = "id name ";
  s += name;
  return s;
}

std::string build_author_msg(std::string_view author) {
  std::string s = "id author ";
  s += author;
  return s;
}

std::string build_uci_ok_msg() { return "uciok"; }

std::string build_ready_ok_msg() { return "readyok"; }

std::string build_bestmove_msg(std::string_view move) {
  std::string s = "bestmove ";
  s += move;
  return s;
}

} // namespace ucicodec
