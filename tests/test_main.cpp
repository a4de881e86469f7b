#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    // Scan logging is noise in test output unless explicitly asked for.
    spdlog::set_level(spdlog::level::warn);
    return Catch::Session().run(argc, argv);
}
