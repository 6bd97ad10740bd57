#include "style.hpp"
#include "utf8.hpp"

int StyledLine::width() const {
  int w = 0;
  for (const auto& r : runs) w += utf8_length(r.text);
  return w;
}

std::string StyledLine::text() const {
  std::string s;
  for (const auto& r : runs) s += r.text;
  return s;
}
