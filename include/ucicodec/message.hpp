// include/ucicodec/message.hpp
#pragma once
#include <string>
#include <string_view>

#include "ucicodec/info.hpp"
#include "ucicodec/option.hpp"

namespace ucicodec {

// Builders return a single line without the trailing newline.

std::string build_name_msg(std::string_view name);       // "id name <name>"
std::string build_author_msg(std::string_view author);   // "id author <author>"
std::string build_uci_ok_msg();                           // "uciok"
std::string build_ready_ok_msg();                         // "readyok"
std::string build_bestmove_msg(std::string_view move);   // "bestmove <move>"

} // namespace ucicodec
