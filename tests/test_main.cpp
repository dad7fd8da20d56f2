#include <gtest/gtest.h>
#include "logging.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // Everything under test logs through the global logger
    core::logging::initialize("signal_synthesis_tests", spdlog::level::warn, spdlog::level::debug);
    return RUN_ALL_TESTS();
}
