#pragma once
#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>

namespace trailnav::logsys {
    void init_console_logs(spdlog::level::level_enum level = spdlog::level::info);
    void init_file_logs(const std::filesystem::path& file,
                        spdlog::level::level_enum level = spdlog::level::info); // rotates 1MB * 4
    std::shared_ptr<spdlog::logger> get();  // "trailnav"; sink-less until one of the inits runs
}
