#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch text commands (rc file lines and the demo's command line).
 * Design: map name -> handler(args, msg); "set name=value" dispatches to the
 *         composite command "set name" with value as the first argument.
 */
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

class CommandRegistry {
public:
  // returns false and fills msg when the arguments are rejected
  using Handler = std::function<bool(const std::vector<std::string>&, std::string&)>;

  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool contains(const std::string& name) const { return map_.count(name) != 0; }
  bool execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const;
  // splits on whitespace; handlers taking free text re-join their args
  bool execute_line(const std::string& line, std::string& msg) const;

private:
  std::unordered_map<std::string, Handler> map_;
};

// trims, drops comments ('#', '"', "//"), strips one leading ':'; "" when nothing remains
std::string normalize_command_line(const std::string& raw);
