// tests/TestMain.cpp
#include <Piston/Utils/Logger.hpp>
#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // Console only; warnings still show up next to failing tests
    Piston::Utils::Logger::Init("", "", spdlog::level::warn, spdlog::level::off);
    int result = RUN_ALL_TESTS();
    Piston::Utils::Logger::Shutdown();
    return result;
}
