#include "binjson/core/log.hpp"

#include "test_main.hpp"

namespace {

using binjson::core::LogLevel;
using binjson::core::log_level;
using binjson::core::set_log_level;
using binjson::core::set_log_pattern;

void test_default_level_is_warn() {
    TEST_EXPECT_EQ(log_level(), LogLevel::warn);
}

void test_log_level_roundtrip() {
    set_log_level(LogLevel::trace);
    TEST_EXPECT_EQ(log_level(), LogLevel::trace);

    set_log_level(LogLevel::debug);
    TEST_EXPECT_EQ(log_level(), LogLevel::debug);

    set_log_level(LogLevel::info);
    TEST_EXPECT_EQ(log_level(), LogLevel::info);

    set_log_level(LogLevel::error);
    TEST_EXPECT_EQ(log_level(), LogLevel::error);

    set_log_level(LogLevel::critical);
    TEST_EXPECT_EQ(log_level(), LogLevel::critical);

    set_log_level(LogLevel::off);
    TEST_EXPECT_EQ(log_level(), LogLevel::off);

    set_log_level(LogLevel::warn);
    TEST_EXPECT_EQ(log_level(), LogLevel::warn);
}

void test_pattern_does_not_change_level() {
    set_log_level(LogLevel::debug);
    set_log_pattern("[%n] %v");
    TEST_EXPECT_EQ(log_level(), LogLevel::debug);
    set_log_level(LogLevel::warn);
}

} // namespace

int main() {
    test_default_level_is_warn();
    test_log_level_roundtrip();
    test_pattern_does_not_change_level();
    return ::binjson::tests::run_and_report();
}
