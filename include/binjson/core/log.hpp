#pragma once

#include <cstdint>
#include <string_view>

namespace binjson::core {

/**
 * @brief 日志级别（用于库内 spdlog 日志的统一控制）。
 *
 * 说明：
 * - 本库内部使用名为 "binjson" 的 spdlog logger，但不把 spdlog 类型暴露到 public headers；
 * - 库只在失败路径（编解码错误、深度超限）输出 debug 日志，成功路径不打日志；
 * - 业务侧可通过 set_log_level 调整该 logger 的级别（默认 warn）。
 */
enum class LogLevel : std::uint8_t {
  trace = 0,
  debug = 1,
  info = 2,
  warn = 3,
  error = 4,
  critical = 5,
  off = 6,
};

// 首次调用时创建 "binjson" logger；创建失败时异常（如 std::bad_alloc）向调用方传播。
void set_log_level(LogLevel level);
[[nodiscard]] LogLevel log_level();

/**
 * @brief 设置 "binjson" logger 的输出格式（spdlog pattern 语法）。
 */
void set_log_pattern(std::string_view pattern);

}  // namespace binjson::core
