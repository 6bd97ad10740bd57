#include "settings.hpp"
#include "file_reader.hpp"
#include <cstdlib>
#include <spdlog/spdlog.h>

static bool parse_positive(const std::string& s, long& out) {
  if (s.empty() || s.size() > 9) return false;
  long v = 0;
  for (char ch : s) {
    if (ch < '0' || ch > '9') return false;
    v = v * 10 + (ch - '0');
  }
  if (v <= 0) return false;
  out = v;
  return true;
}

static bool parse_level(const std::string& s, spdlog::level::level_enum& out) {
  static const char* names[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
  for (const char* n : names) {
    if (s == n) { out = spdlog::level::from_str(s); return true; }
  }
  return false;
}

void register_setting_commands(CommandRegistry& reg, Settings& s) {
  reg.register_command("set framestyle", [&s](const std::vector<std::string>& args, std::string& msg) {
    auto style = args.empty() ? std::nullopt : parse_frame_style(args[0]);
    if (!style) { msg = "set framestyle: use single|double|thick|rounded"; return false; }
    s.frame_style = *style;
    msg = std::string("framestyle ") + frame_style_name(*style);
    return true;
  });
  reg.register_command("set loglevel", [&s](const std::vector<std::string>& args, std::string& msg) {
    spdlog::level::level_enum lv;
    if (args.empty() || !parse_level(args[0], lv)) {
      msg = "set loglevel: use trace|debug|info|warn|error|critical|off";
      return false;
    }
    s.log_level = lv;
    msg = "loglevel " + args[0];
    return true;
  });
  reg.register_command("set logfile", [&s](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { msg = "set logfile: use set logfile=<path>"; return false; }
    s.log_file = args[0];
    msg = "logfile " + s.log_file;
    return true;
  });
  reg.register_command("set statsinterval", [&s](const std::vector<std::string>& args, std::string& msg) {
    long ms = 0;
    if (args.empty() || !parse_positive(args[0], ms)) {
      msg = "set statsinterval: use a positive number of milliseconds";
      return false;
    }
    s.stats_interval = std::chrono::milliseconds(ms);
    msg = "statsinterval " + args[0] + " ms";
    return true;
  });
}

bool apply_setting_line(Settings& s, const std::string& line, std::string& msg) {
  std::string cmd = normalize_command_line(line);
  if (cmd.empty()) return true;
  CommandRegistry reg;
  register_setting_commands(reg, s);
  return reg.execute_line(cmd, msg);
}

bool load_settings(const std::filesystem::path& path, Settings& s, std::string& msg) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::vector<std::string> lines;
  if (!read_lines(path, lines, msg)) return false;

  CommandRegistry reg;
  register_setting_commands(reg, s);
  bool ok = true;
  int lineno = 0;
  for (const std::string& raw : lines) {
    ++lineno;
    std::string cmd = normalize_command_line(raw);
    if (cmd.empty()) continue;
    std::string m;
    if (!reg.execute_line(cmd, m)) {
      ok = false;
      msg = path.filename().string() + ":" + std::to_string(lineno) + ": " + m;
      spdlog::warn("{}", msg);
    }
  }
  return ok;
}

std::optional<std::filesystem::path> default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) return std::nullopt;
  return std::filesystem::path(home) / QV_RC_FILE_NAME;
}
