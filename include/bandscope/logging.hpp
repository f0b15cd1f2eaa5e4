#pragma once

#include <spdlog/logger.h>

#include <memory>
#include <string>

namespace bandscope {

/// Returns the shared "bandscope" logger, creating a stderr color logger on
/// first use if none has been installed.
std::shared_ptr<spdlog::logger> logger();

/// Replaces the shared logger with one writing to `path`.
/// Used by the terminal front end so diagnostics do not draw over curses.
void log_to_file(const std::string& path);

}  // namespace bandscope
