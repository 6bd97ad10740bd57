#pragma once
/*
 * App
 *
 * Purpose: demo application driving the engine: key loop, sections, command line,
 *          resize handling and the statistics worker.
 * Note: owns all application state and hands RenderCoordinator a fresh snapshot
 *       every cycle; the worker only feeds the stats part of that snapshot.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "cmd_registry.hpp"
#include "input.hpp"
#include "layout_engine.hpp"
#include "ncurses_terminal.hpp"
#include "render_coordinator.hpp"
#include "settings.hpp"
#include "stats_worker.hpp"
#include "types.hpp"

class App {
public:
  App(const std::optional<std::filesystem::path>& file, const Settings& settings,
      const std::string& startup_message);
  void run();

  AppSnapshot snapshot() const;

private:
  enum class Section { Home, Layout, Styles, Log, File };

  void relayout();
  void render();
  void handle_input(int ch);
  void handle_display_key(const KeyAction& k);
  void handle_input_key(const KeyAction& k);
  void move_selection(int delta);
  void activate(int index);
  std::string body_for(Section s) const;
  void execute_command();
  void register_commands();
  void apply_live_settings();

  Settings settings_;
  NcursesTerminal term_;
  LayoutEngine engine_;
  std::optional<RenderCoordinator> coord_;
  std::optional<TerminalTooSmall> too_small_;
  bool too_small_drawn_ = false;
  StatsWorker worker_;
  CommandRegistry registry_;
  Input input_;

  Mode mode_ = Mode::Display;
  std::string cmdline_;
  std::string status_;
  std::vector<Section> sections_;
  int selected_ = 0;
  Section active_ = Section::Home;
  std::string body_;
  std::optional<std::filesystem::path> file_;
  std::vector<std::string> file_lines_;
  std::string file_message_;
  std::vector<std::string> log_lines_;
  int total_commands_ = 0;
  std::string last_command_;
  bool should_quit_ = false;
};
