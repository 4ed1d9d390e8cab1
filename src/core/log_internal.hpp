#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace binjson::core::detail {

// 库内共享的 logger；只在 .cpp 中使用，避免 spdlog 泄漏到 public headers。
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

}  // namespace binjson::core::detail
