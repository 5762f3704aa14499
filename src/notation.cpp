#include "ucicodec/notation.hpp"

#include <cctype>
#include <sstream>
#include <string>

namespace ucicodec {

static inline bool is_digit(char c) { return c >= '0' && c <= '9'; }
static inline bool is_file(char c) { return c >= 'a' && c <= 'h'; }
static inline bool is_rank(char c) { return c >= '1' && c <= '8'; }

static inline bool is_placement_char(char c) {
  switch (c) {
    case 'p': case 'n': case 'b': case 'r': case 'q': case 'k':
    case 'P': case 'N': case 'B': case 'R': case 'Q': case 'K':
      return true;
    default:
      return c >= '1' && c <= '8';
  }
}

static inline bool is_promo_char(char c) {
  switch (c) {
    case 'r': case 'n': case 'b': case 'q':
    case 'R': case 'N': case 'B': case 'Q':
      return true;
    default:
      return false;
  }
}

static bool is_number(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) if (!is_digit(c)) return false;
  return true;
}

// 1) Piece placement: eight groups of 1..8 characters separated by '/'
static bool valid_placement(const std::string& p) {
  int groups = 0;
  int len = 0;
  for (char ch : p) {
    if (ch == '/') {
      if (len == 0) return false;
      ++groups;
      len = 0;
      continue;
    }
    if (!is_placement_char(ch)) return false;
    if (++len > 8) return false;
  }
  if (len == 0) return false;
  return groups + 1 == 8;
}

// 3) Castling rights: "-" or K?Q?k?q
static bool valid_castling(const std::string& c) {
  if (c == "-") return true;
  if (c.empty() || c.back() != 'q') return false;
  static constexpr char ORDER[] = "KQk";
  int next = 0;
  for (std::size_t i = 0; i + 1 < c.size(); ++i) {
    while (next < 3 && ORDER[next] != c[i]) ++next;
    if (next == 3) return false;
    ++next;
  }
  return true;
}

// 4) En-passant target: "-" or a file followed by rank 3..6
static bool valid_ep(const std::string& ep) {
  if (ep == "-") return true;
  return ep.size() == 2 && is_file(ep[0]) && ep[1] >= '3' && ep[1] <= '6';
}

bool is_valid_fen(std::string_view fen) {
  // Leading whitespace is not part of the grammar; the parser never produces it,
  // but other callers may pass arbitrary strings.
  if (fen.empty() || std::isspace(static_cast<unsigned char>(fen.front()))) return false;

  std::istringstream ss{std::string(fen)};
  std::string placement, active, castling, ep, half, full, extra;
  if (!(ss >> placement >> active >> castling >> ep >> half >> full)) return false;
  if (ss >> extra) return false;

  return valid_placement(placement)
      && (active == "w" || active == "b")
      && valid_castling(castling)
      && valid_ep(ep)
      && is_number(half)
      && is_number(full);
}

bool is_valid_move(std::string_view m) {
  if (m.size() != 4 && m.size() != 5) return false;
  if (!is_file(m[0]) || !is_rank(m[1]) || !is_file(m[2]) || !is_rank(m[3])) return false;
  return m.size() == 4 || is_promo_char(m[4]);
}

} // namespace ucicodec
