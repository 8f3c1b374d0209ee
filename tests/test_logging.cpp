#include <doctest/doctest.h>
#include "logging/Log.h"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

TEST_CASE("Logging/FileSinkWritesMessages") {
    const fs::path dir = fs::temp_directory_path() / "tilegen_log_test";
    fs::remove_all(dir);

    tilegen::logsys::init_file_logs(dir, spdlog::level::debug);
    REQUIRE(tilegen::logsys::get() != nullptr);
    CHECK(tilegen::logsys::get()->name() == "tilegen");
    CHECK(spdlog::default_logger() == tilegen::logsys::get());

    spdlog::warn("placement: probe {}", 7);
    tilegen::logsys::get()->flush();

    std::ifstream in(dir / "tilegen.log");
    REQUIRE(in.is_open());
    std::stringstream ss;
    ss << in.rdbuf();
    CHECK(ss.str().find("placement: probe 7") != std::string::npos);
    CHECK(ss.str().find("[warning]") != std::string::npos);

    // Restore the quiet console logger the rest of the suite expects.
    tilegen::logsys::init_console_logs(spdlog::level::warn);
    in.close();
    fs::remove_all(dir);
}

TEST_CASE("Logging/ConsoleLevel") {
    tilegen::logsys::init_console_logs(spdlog::level::err);
    CHECK_FALSE(spdlog::should_log(spdlog::level::warn));
    CHECK(spdlog::should_log(spdlog::level::err));
    tilegen::logsys::init_console_logs(spdlog::level::warn);
}
