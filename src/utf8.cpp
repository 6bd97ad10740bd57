#include "utf8.hpp"

static size_t seq_len(std::string_view s, size_t i) {
  unsigned char c = static_cast<unsigned char>(s[i]);
  size_t n = 1;
  if (c >= 0xF0 && c <= 0xF4) n = 4;
  else if (c >= 0xE0) n = (c >= 0xF0) ? 1 : 3;
  else if (c >= 0xC2) n = 2;
  if (i + n > s.size()) return 1;
  for (size_t k = 1; k < n; ++k) {
    unsigned char cc = static_cast<unsigned char>(s[i + k]);
    if ((cc & 0xC0) != 0x80) return 1;
  }
  return n;
}

int utf8_length(std::string_view s) {
  int n = 0;
  for (size_t i = 0; i < s.size(); i += seq_len(s, i)) n++;
  return n;
}

size_t utf8_offset(std::string_view s, int n) {
  size_t i = 0;
  while (n > 0 && i < s.size()) { i += seq_len(s, i); n--; }
  return i;
}

std::vector<std::string> utf8_glyphs(std::string_view s) {
  std::vector<std::string> out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size();) {
    size_t n = seq_len(s, i);
    out.emplace_back(s.substr(i, n));
    i += n;
  }
  return out;
}

std::string utf8_prefix(std::string_view s, int n) {
  if (n <= 0) return std::string();
  return std::string(s.substr(0, utf8_offset(s, n)));
}

std::string utf8_suffix(std::string_view s, int n) {
  int total = utf8_length(s);
  if (n >= total) return std::string(s);
  if (n <= 0) return std::string();
  return std::string(s.substr(utf8_offset(s, total - n)));
}
