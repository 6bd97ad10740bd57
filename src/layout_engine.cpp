#include "layout_engine.hpp"
#include "config.hpp"
#include <algorithm>
#include <string>
#include <spdlog/spdlog.h>

static std::string size_str(TermSize s) {
  return std::to_string(s.rows) + "x" + std::to_string(s.cols);
}

TerminalTooSmall::TerminalTooSmall(TermSize cur, TermSize min)
  : std::runtime_error("terminal size " + size_str(cur) + " is below minimum " + size_str(min)),
    current(cur), minimum(min) {}

const Region& LayoutPlan::region(RegionId id) const {
  switch (id) {
    case RegionId::Top: return top;
    case RegionId::Left: return left;
    case RegionId::Main: return main;
    case RegionId::Bottom: return bottom;
  }
  return main;
}

LayoutEngine::LayoutEngine() : min_sizes_(default_minimums()) {}

LayoutEngine::LayoutEngine(const MinimumTable& minimums) : min_sizes_(minimums) {}

LayoutEngine::MinimumTable LayoutEngine::default_minimums() {
  MinimumTable t{};
  t[region_index(RegionId::Top)] = {QV_TOP_MIN_ROWS, QV_TOP_MIN_COLS};
  t[region_index(RegionId::Left)] = {QV_LEFT_MIN_ROWS, QV_LEFT_MIN_COLS};
  t[region_index(RegionId::Main)] = {QV_MAIN_MIN_ROWS, QV_MAIN_MIN_COLS};
  t[region_index(RegionId::Bottom)] = {QV_BOTTOM_MIN_ROWS, QV_BOTTOM_MIN_COLS};
  return t;
}

TermSize LayoutEngine::minimum_terminal_size() {
  return {QV_MIN_TERMINAL_ROWS, QV_MIN_TERMINAL_COLS};
}

bool LayoutEngine::terminal_fits(int rows, int cols) {
  return rows >= QV_MIN_TERMINAL_ROWS && cols >= QV_MIN_TERMINAL_COLS;
}

TermSize LayoutEngine::region_minimum(RegionId id) const {
  return min_sizes_[region_index(id)];
}

LayoutPlan LayoutEngine::compute_layout(int rows, int cols) const {
  if (!terminal_fits(rows, cols)) {
    spdlog::warn("layout rejected: terminal {}x{} below {}x{}", rows, cols,
                 QV_MIN_TERMINAL_ROWS, QV_MIN_TERMINAL_COLS);
    throw TerminalTooSmall({rows, cols}, minimum_terminal_size());
  }
  LayoutPlan p;
  p.terminal_height = rows;
  p.terminal_width = cols;
  p.top = Region{0, 0, QV_BAR_HEIGHT, cols};
  p.bottom = Region{rows - QV_BAR_HEIGHT, 0, QV_BAR_HEIGHT, cols};
  int body_h = rows - p.top.height - p.bottom.height;
  int left_w = std::max(QV_LEFT_MIN_WIDTH, cols / QV_LEFT_WIDTH_DIVISOR);
  p.left = Region{p.top.height, 0, body_h, left_w};
  p.main = Region{p.top.height, left_w, body_h, cols - left_w};

  // rounding can starve a region even when the terminal itself is large enough
  for (RegionId id : kRegionOrder) {
    const Region& r = p.region(id);
    TermSize min = region_minimum(id);
    if (r.height < min.rows || r.width < min.cols) {
      spdlog::warn("layout rejected: {} region {}x{} below {}x{}", region_name(id),
                   r.height, r.width, min.rows, min.cols);
      throw TerminalTooSmall({rows, cols}, minimum_terminal_size());
    }
  }
  spdlog::debug("layout {}x{}: left={}x{} main={}x{}", rows, cols,
                p.left.height, p.left.width, p.main.height, p.main.width);
  return p;
}

LayoutPlan compute_layout(int rows, int cols) {
  static const LayoutEngine engine;
  return engine.compute_layout(rows, cols);
}

bool detect_size_change(const LayoutPlan& plan, int rows, int cols) {
  return plan.terminal_height != rows || plan.terminal_width != cols;
}
