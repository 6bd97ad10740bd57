#pragma once
/*
 * Geometry
 *
 * Purpose: plain value types for terminal cells (Region, TermSize, RegionId).
 * Principle: no behavior beyond trivial arithmetic; LayoutEngine creates them.
 */
#include <array>

struct TermSize {
  int rows = 0;
  int cols = 0;
  bool operator==(const TermSize&) const = default;
};

struct Region {
  int y = 0;
  int x = 0;
  int height = 0;
  int width = 0;

  int area() const { return height * width; }
  bool empty() const { return height <= 0 || width <= 0; }
  bool contains(int row, int col) const {
    return row >= y && row < y + height && col >= x && col < x + width;
  }
  bool operator==(const Region&) const = default;
};

inline bool overlaps(const Region& a, const Region& b) {
  if (a.empty() || b.empty()) return false;
  return a.x < b.x + b.width && b.x < a.x + a.width &&
         a.y < b.y + b.height && b.y < a.y + a.height;
}

enum class RegionId { Top = 0, Left = 1, Main = 2, Bottom = 3 };

inline constexpr int kRegionCount = 4;

// draw order; never changes
inline constexpr std::array<RegionId, kRegionCount> kRegionOrder = {
  RegionId::Top, RegionId::Left, RegionId::Main, RegionId::Bottom
};

inline int region_index(RegionId id) { return static_cast<int>(id); }

inline const char* region_name(RegionId id) {
  switch (id) {
    case RegionId::Top: return "top";
    case RegionId::Left: return "left";
    case RegionId::Main: return "main";
    case RegionId::Bottom: return "bottom";
  }
  return "unknown";
}
