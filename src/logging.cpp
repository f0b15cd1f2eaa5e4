#include "bandscope/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace bandscope {

namespace {

constexpr const char* kLoggerName = "bandscope";

std::mutex g_logger_mutex;

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock{g_logger_mutex};
    auto existing = spdlog::get(kLoggerName);
    if (existing) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
}

void log_to_file(const std::string& path) {
    std::lock_guard<std::mutex> lock{g_logger_mutex};
    spdlog::drop(kLoggerName);
    auto file_logger = spdlog::basic_logger_mt(kLoggerName, path, /*truncate=*/true);
    file_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [thread %t] %v");
    file_logger->flush_on(spdlog::level::warn);
}

}  // namespace bandscope
