#include <cassert>

#include "ucicodec/parse.hpp"
#include "expect_error.hpp"

using namespace ucicodec;
using namespace ucicodec::test;

int main() {
  {
    auto p = parse_setoption(tokenize("setoption name Hash value 128"));
    assert(p.name == "Hash");
    assert(p.value == "128");
  }
  // Value segment is optional
  {
    auto p = parse_setoption(tokenize("setoption name Hash"));
    assert(p.name == "Hash");
    assert(p.value.empty());
  }
  // Keywords in any order, last occurrence wins
  {
    auto p = parse_setoption(tokenize("setoption value 1 name A name B value 2"));
    assert(p.name == "B");
    assert(p.value == "2");
  }
  // Unknown option names are not this layer's concern
  {
    auto p = parse_setoption(tokenize("setoption name NoSuchOption value x"));
    assert(p.name == "NoSuchOption");
  }
  // Too short
  {
    auto d = expect_detail<InvalidLength>([] { parse_setoption(tokenize("setoption")); });
    assert((d == InvalidLength{3, UNBOUNDED, 1}));

    d = expect_detail<InvalidLength>([] { parse_setoption(tokenize("setoption name")); });
    assert(d.got == 2);
  }
  // Keyword without its argument
  {
    auto d = expect_detail<UnknownToken>([] { parse_setoption(tokenize("setoption name Hash value")); });
    assert(d.token == "value");

    d = expect_detail<UnknownToken>([] { parse_setoption(tokenize("setoption value 1 name")); });
    assert(d.token == "name");
  }
  // Unknown keyword, including a multi-word name
  {
    auto d = expect_detail<UnknownToken>([] { parse_setoption(tokenize("setoption name Move Overhead value 10")); });
    assert(d.token == "Overhead");

    d = expect_detail<UnknownToken>([] { parse_setoption(tokenize("setoption label Hash")); });
    assert(d.token == "label");
  }
  {
    auto d = expect_detail<InvalidCommandType>([] { parse_setoption(tokenize("unknown name Hash value 128")); });
    assert((d == InvalidCommandType{"setoption", "unknown"}));
  }
  return 0;
}
