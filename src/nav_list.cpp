#include "nav_list.hpp"
#include "utf8.hpp"
#include <algorithm>

static const char* kEllipsis = "...";
static const char* kPlaceholder = "No items";

int clamp_selection(int selected, int count) {
  if (count <= 0) return 0;
  return std::clamp(selected, 0, count - 1);
}

static std::string fit_item(const std::string& prefix, const std::string& item, int width) {
  int avail = width - utf8_length(prefix);
  std::string body = item;
  if (utf8_length(item) > avail) {
    body = avail > 3 ? utf8_prefix(item, avail - 3) + kEllipsis : utf8_prefix(item, avail);
  }
  std::string text = utf8_prefix(prefix + body, width);
  int len = utf8_length(text);
  if (len < width) text.append(static_cast<size_t>(width - len), ' ');
  return text;
}

NavListView format_nav_list(const std::vector<std::string>& items, int selected, int width, int height) {
  NavListView v;
  int n = static_cast<int>(items.size());
  v.selected = clamp_selection(selected, n);
  if (width <= 0 || height <= 0) return v;
  if (n == 0) {
    v.runs.push_back(StyledRun{utf8_prefix(kPlaceholder, width), Style{}});
    return v;
  }

  if (v.selected >= height) v.scroll_offset = v.selected - height + 1;
  v.scroll_offset = std::min(v.scroll_offset, std::max(0, n - height));
  v.more_above = v.scroll_offset > 0;
  v.more_below = v.scroll_offset + height < n;

  int rows = std::min(height, n - v.scroll_offset);
  for (int i = 0; i < rows; ++i) {
    int idx = v.scroll_offset + i;
    bool is_sel = idx == v.selected;
    std::string prefix = is_sel ? std::string("> ") : std::to_string(idx + 1) + ". ";
    std::string text = fit_item(prefix, items[idx], width);
    Style st = is_sel ? reverse_style() : Style{};

    const char* indicator = nullptr;
    if (i == 0 && v.more_above) indicator = "^";
    else if (i == height - 1 && v.more_below) indicator = "v";

    if (i > 0) v.runs.push_back(StyledRun{"\n", Style{}});
    if (indicator) {
      v.runs.push_back(StyledRun{utf8_prefix(text, width - 1), st});
      v.runs.push_back(StyledRun{indicator, bold_style()});
    } else {
      v.runs.push_back(StyledRun{text, st});
    }
  }
  return v;
}
