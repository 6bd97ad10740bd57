#include "text_wrapper.hpp"
#include "utf8.hpp"
#include <string_view>

std::vector<StyledLine> wrap(const std::vector<StyledRun>& runs, int width) {
  if (width < 1) width = 1;
  std::vector<StyledLine> lines;
  StyledLine cur;
  int cur_w = 0;
  bool open = false; // cur was started by a break and must be emitted even if empty

  auto flush = [&]() {
    lines.push_back(std::move(cur));
    cur = StyledLine{};
    cur_w = 0;
  };

  for (const auto& run : runs) {
    std::string_view text(run.text);
    size_t seg_start = 0;
    bool first = true;
    while (seg_start <= text.size()) {
      size_t nl = text.find('\n', seg_start);
      size_t seg_end = (nl == std::string_view::npos) ? text.size() : nl;
      if (!first) { flush(); open = true; }
      first = false;

      std::string_view rest = text.substr(seg_start, seg_end - seg_start);
      while (!rest.empty()) {
        int avail = width - cur_w;
        if (avail <= 0) { flush(); avail = width; }
        int n = utf8_length(rest);
        if (n <= avail) {
          cur.runs.push_back(StyledRun{std::string(rest), run.style});
          cur_w += n;
          break;
        }
        size_t cut = utf8_offset(rest, avail);
        cur.runs.push_back(StyledRun{std::string(rest.substr(0, cut)), run.style});
        cur_w += avail;
        rest = rest.substr(cut);
        flush();
      }
      if (nl == std::string_view::npos) break;
      seg_start = nl + 1;
    }
  }
  if (open || !cur.runs.empty()) lines.push_back(std::move(cur));
  return lines;
}

std::vector<StyledLine> wrap_text(const std::string& text, int width, const Style& style) {
  return wrap({StyledRun{text, style}}, width);
}
