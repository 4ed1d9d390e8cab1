#include "binjson/core/log.hpp"

#include "test_main.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

using binjson::core::LogLevel;
using binjson::core::log_level;
using binjson::core::set_log_level;

// 业务侧先注册同名 logger 时，库复用它而不是再次注册（再次注册会抛 spdlog_ex）。
void test_reuses_logger_registered_by_application() {
    auto mine = spdlog::stderr_color_mt("binjson");
    mine->set_level(spdlog::level::info);

    TEST_EXPECT_EQ(log_level(), LogLevel::info);

    set_log_level(LogLevel::debug);
    TEST_EXPECT_EQ(mine->level(), spdlog::level::debug);
    TEST_EXPECT(spdlog::get("binjson") == mine);
}

} // namespace

int main() {
    test_reuses_logger_registered_by_application();
    return ::binjson::tests::run_and_report();
}
