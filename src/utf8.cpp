#include "utf8.hpp"
#include <algorithm>

static size_t seq_len(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead >> 5) == 0x6) return 2;
  if ((lead >> 4) == 0xE) return 3;
  if ((lead >> 3) == 0x1E) return 4;
  return 1; // stray continuation byte: one cell
}

int utf8_length(std::string_view s) {
  int n = 0;
  for (size_t i = 0; i < s.size(); i += seq_len(static_cast<unsigned char>(s[i]))) n++;
  return n;
}

std::string_view utf8_prefix(std::string_view s, int max_cells) {
  if (max_cells <= 0) return {};
  size_t i = 0;
  int n = 0;
  while (i < s.size() && n < max_cells) {
    i += seq_len(static_cast<unsigned char>(s[i]));
    n++;
  }
  return s.substr(0, std::min(i, s.size()));
}

std::vector<std::string> utf8_split(std::string_view s) {
  std::vector<std::string> out;
  size_t i = 0;
  while (i < s.size()) {
    size_t len = std::min(seq_len(static_cast<unsigned char>(s[i])), s.size() - i);
    out.emplace_back(s.substr(i, len));
    i += len;
  }
  return out;
}
