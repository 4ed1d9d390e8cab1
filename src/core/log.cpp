#include "binjson/core/log.hpp"

#include "log_internal.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <string>

namespace binjson::core {
namespace {

constexpr const char* kLoggerName = "binjson";

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::trace:
      return spdlog::level::trace;
    case LogLevel::debug:
      return spdlog::level::debug;
    case LogLevel::info:
      return spdlog::level::info;
    case LogLevel::warn:
      return spdlog::level::warn;
    case LogLevel::error:
      return spdlog::level::err;
    case LogLevel::critical:
      return spdlog::level::critical;
    case LogLevel::off:
      return spdlog::level::off;
  }
  return spdlog::level::off;
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
  switch (level) {
    case spdlog::level::trace:
      return LogLevel::trace;
    case spdlog::level::debug:
      return LogLevel::debug;
    case spdlog::level::info:
      return LogLevel::info;
    case spdlog::level::warn:
      return LogLevel::warn;
    case spdlog::level::err:
      return LogLevel::error;
    case spdlog::level::critical:
      return LogLevel::critical;
    default:
      return LogLevel::off;
  }
}

std::shared_ptr<spdlog::logger> make_logger() {
  // 业务侧可能已经注册了同名 logger（例如接入自己的 sink），此时直接复用。
  if (auto existing = spdlog::get(kLoggerName)) {
    return existing;
  }
  std::shared_ptr<spdlog::logger> created;
  try {
    created = spdlog::stderr_color_mt(kLoggerName);
  } catch (const spdlog::spdlog_ex&) {
    // 检查与注册之间被其他线程抢先注册了同名 logger。
    if (auto existing = spdlog::get(kLoggerName)) {
      return existing;
    }
    created = std::make_shared<spdlog::logger>(kLoggerName, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  created->set_level(spdlog::level::warn);
  return created;
}

}  // namespace

namespace detail {

std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> instance = make_logger();
  return instance;
}

}  // namespace detail

void set_log_level(LogLevel level) {
  detail::logger()->set_level(to_spdlog_level(level));
}

LogLevel log_level() { return from_spdlog_level(detail::logger()->level()); }

void set_log_pattern(std::string_view pattern) {
  detail::logger()->set_pattern(std::string(pattern));
}

}  // namespace binjson::core
