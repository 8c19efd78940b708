/// @file test_main.cpp
/// @brief doctest runner for skychart_tests: initializes logging around the test run.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/logger.hpp"

int main(int argc, char** argv)
{
    // Loaders log every skipped row; keep the test output to real problems.
    skychart::core::Logger::init({.console_level = spdlog::level::err});
    const int result = doctest::Context(argc, argv).run();
    skychart::core::Logger::shutdown();
    return result;
}
