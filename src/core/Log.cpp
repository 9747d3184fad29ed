#include "trailnav/core/Log.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <system_error>

namespace fs = std::filesystem;

namespace {

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

void install(std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level) {
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l][%t] %v");
    logger->flush_on(spdlog::level::warn);
    std::lock_guard lk(g_mutex);
    g_logger = std::move(logger);
}

} // namespace

void trailnav::logsys::init_console_logs(spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    install(std::make_shared<spdlog::logger>("trailnav", std::move(sink)), level);
}

void trailnav::logsys::init_file_logs(const fs::path& file, spdlog::level::level_enum level) {
    std::error_code ec;
    if (file.has_parent_path()) fs::create_directories(file.parent_path(), ec);
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file.string(), 1 << 20, 4);
    install(std::make_shared<spdlog::logger>("trailnav", std::move(sink)), level);
    get()->info("Logging started");
}

std::shared_ptr<spdlog::logger> trailnav::logsys::get() {
    std::lock_guard lk(g_mutex);
    if (!g_logger) {
        // No sinks: messages are formatted nowhere until an init call.
        g_logger = std::make_shared<spdlog::logger>("trailnav");
        g_logger->set_level(spdlog::level::off);
    }
    return g_logger;
}
