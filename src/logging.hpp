#pragma once
/*
 * Logging
 *
 * Purpose: install the default spdlog logger. The terminal owns stdout, so logs go
 *          to the configured file or nowhere.
 * Note: a file that cannot be opened falls back to the null sink; msg explains why.
 */
#include <string>
#include "settings.hpp"

bool init_logging(const Settings& s, std::string& msg);
