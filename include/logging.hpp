#pragma once

#include <string>

// Routes the default spdlog logger to stderr at the given level
// (trace, debug, info, warn, error, critical, off).
void setupLogging(const std::string& level);
