#include "ucicodec/echo_handler.hpp"
#include "ucicodec/uci.hpp"

#include <iostream>

using namespace ucicodec;

int main() {
  std::ios::sync_with_stdio(false);
  std::cin.tie(nullptr);

  DriverConfig cfg;
  cfg.name = "UciCodec Echo";
  cfg.options = {
    OptionMsg::spin("Hash", "16", 1, 1024),
    OptionMsg::check("Ponder", false),
  };

  EchoHandler handler;
  uci_loop(std::cin, std::cout, handler, cfg);
  return 0;
}
