// tests/test_main.cpp
//
// The only translation unit in tilegen_tests that defines DOCTEST_CONFIG_IMPLEMENT.
// Every other test file includes doctest without it.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

#include <cstdlib>
#include <cstring>

#include "logging/Log.h"

namespace {

bool env_truthy(const char* v) {
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}

bool running_in_ci() {
    return env_truthy(std::getenv("CI")) ||
           env_truthy(std::getenv("GITHUB_ACTIONS")) ||
           env_truthy(std::getenv("TF_BUILD"));
}

} // namespace

int main(int argc, char** argv) {
    // Generators log every run at info; keep test output to warnings and up.
    tilegen::logsys::init_console_logs(spdlog::level::warn);

    doctest::Context context;

    context.setOption("order-by", "name");        // deterministic ordering
    context.setOption("duration", true);
    context.setOption("no-path-filenames", true);

    if (running_in_ci()) {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    context.applyCommandLine(argc, argv);

    const int res = context.run();
    spdlog::shutdown();
    return res;
}
