#include "terminal.hpp"
#include "app.hpp"
#include "logging.hpp"
#include "settings.hpp"
#include <filesystem>
#include <optional>

int main(int argc, char** argv) {
  std::optional<std::filesystem::path> path;
  if (argc >= 2) path = std::filesystem::path(argv[1]);

  Settings settings;
  std::string message;
  if (auto rc = default_rc_path()) {
    std::string m;
    if (!load_settings(*rc, settings, m)) message = m;
  }
  std::string log_msg;
  if (!init_logging(settings, log_msg)) message = log_msg;

  Terminal term;
  App app(path, settings, message);
  app.run();
  return 0;
}
