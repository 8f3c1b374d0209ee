#include "Log.h"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <system_error>

namespace fs = std::filesystem;
static std::shared_ptr<spdlog::logger> g_logger;

static void install(std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level) {
    if (g_logger) spdlog::drop(g_logger->name());
    g_logger = std::move(logger);
    g_logger->set_level(level);
    spdlog::set_default_logger(g_logger);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void tilegen::logsys::init_console_logs(spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    install(std::make_shared<spdlog::logger>("tilegen", std::move(sink)), level);
}

void tilegen::logsys::init_file_logs(const fs::path& dir, spdlog::level::level_enum level) {
    std::error_code ec; fs::create_directories(dir, ec);
    if (ec) {
        // fall back to stderr so the failure itself is visible
        init_console_logs(level);
        spdlog::warn("Log directory {} unavailable ({}), logging to stderr", dir.string(), ec.message());
        return;
    }
    auto file = (dir / "tilegen.log").string();
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1 << 20, 4); // 1MB * 4
    install(std::make_shared<spdlog::logger>("tilegen", std::move(sink)), level);
    spdlog::info("Logging started");
}

std::shared_ptr<spdlog::logger> tilegen::logsys::get() {
    return g_logger ? g_logger : spdlog::default_logger();
}
