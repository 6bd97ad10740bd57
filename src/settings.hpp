#pragma once
/*
 * Settings
 *
 * Purpose: runtime options read from $HOME/.quadviewrc ("set name=value" lines).
 * Options: framestyle, loglevel, logfile, statsinterval.
 * Note: a bad line yields a message and is skipped; the rest still apply.
 */
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <spdlog/common.h>
#include "cmd_registry.hpp"
#include "config.hpp"
#include "frame_renderer.hpp"

struct Settings {
  FrameStyle frame_style = default_frame_style();
  spdlog::level::level_enum log_level = spdlog::level::info;
  std::string log_file;
  std::chrono::milliseconds stats_interval{QV_DEFAULT_STATS_INTERVAL_MS};
};

// adds the "set <option>" commands writing into s; s must outlive reg
void register_setting_commands(CommandRegistry& reg, Settings& s);
bool apply_setting_line(Settings& s, const std::string& line, std::string& msg);
// a missing file is not an error; msg holds the last failure when false
bool load_settings(const std::filesystem::path& path, Settings& s, std::string& msg);
std::optional<std::filesystem::path> default_rc_path();
