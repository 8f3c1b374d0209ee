#pragma once
#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>

namespace tilegen::logsys {
    // Both create the "tilegen" logger and install it as the spdlog default.
    void init_console_logs(spdlog::level::level_enum level = spdlog::level::info);
    void init_file_logs(const std::filesystem::path& dir,               // rotates tilegen.log, 1MB * 4
                        spdlog::level::level_enum level = spdlog::level::info);
    std::shared_ptr<spdlog::logger> get();  // "tilegen", or the spdlog default before init
}
