#include "logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

static void install_null_logger() {
  auto logger = spdlog::null_logger_mt("quadview-null");
  spdlog::set_default_logger(logger);
}

bool init_logging(const Settings& s, std::string& msg) {
  spdlog::drop("quadview");
  spdlog::drop("quadview-null");
  if (s.log_file.empty()) {
    install_null_logger();
    return true;
  }
  try {
    auto logger = spdlog::basic_logger_mt("quadview", s.log_file);
    logger->set_level(s.log_level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    spdlog::info("quadview {} logging to {}", QV_VERSION, s.log_file);
    return true;
  } catch (const spdlog::spdlog_ex& e) {
    install_null_logger();
    msg = std::string("logging disabled: ") + e.what();
    return false;
  }
}
