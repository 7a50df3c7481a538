// test/test_runner.cpp
// -----------------------------------------------------------
// Google Test entry point for every unit and integration suite.
// Logging is kept at WARN so test output stays readable.

#include <gtest/gtest.h>
#include "util/logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    shardavail::util::logger::setLogLevel(shardavail::util::logger::LogLevel::WARN);
    return RUN_ALL_TESTS();
}
