#include "cmd_registry.hpp"
#include <cctype>
#include <sstream>

bool CommandRegistry::execute(const std::string& name, const std::vector<std::string>& args,
                              std::string& msg) const {
  auto it = map_.find(name);
  if (it == map_.end()) { msg = "unknown command: " + name; return false; }
  return it->second(args, msg);
}

bool CommandRegistry::execute_line(const std::string& line, std::string& msg) const {
  std::istringstream iss(line);
  std::string cmd; iss >> cmd;
  if (cmd.empty()) { msg = "empty command"; return false; }
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd == "set" && !args.empty()) {
    std::string name = args[0];
    std::string value;
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
      value = name.substr(eq + 1);
      name = name.substr(0, eq);
    }
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    return execute("set " + name, subargs, msg);
  }
  return execute(cmd, args, msg);
}

std::string normalize_command_line(const std::string& raw) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  size_t i = 0; while (i < raw.size() && is_space(static_cast<unsigned char>(raw[i]))) i++;
  size_t j = raw.size(); while (j > i && is_space(static_cast<unsigned char>(raw[j - 1]))) j--;
  std::string s = raw.substr(i, j - i);
  if (s.empty()) return s;
  if (s[0] == '#' || s[0] == '"') return std::string();
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return std::string();
  if (s[0] == ':') s.erase(s.begin());
  return s;
}
