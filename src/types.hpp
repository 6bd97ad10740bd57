#pragma once
/*
 * Types
 *
 * Purpose: the immutable per-frame snapshot handed to RenderCoordinator::update.
 * Principle: plain values copied on every cycle; no shared mutable state.
 */
#include <string>
#include <vector>

enum class Mode { Display, Input };

struct StatsSnapshot {
  long uptime_seconds = 0;
  int content_lines = 0;
  int total_commands = 0;
  std::string last_command;
  bool operator==(const StatsSnapshot&) const = default;
};

struct AppSnapshot {
  // top
  std::string title;
  std::string author;
  std::string version;
  // left
  std::vector<std::string> nav_items;
  int selected_index = 0;
  // main
  std::string body_text;
  // bottom
  std::string status;
  Mode mode = Mode::Display;
  std::string command_input;
  StatsSnapshot stats;
};
