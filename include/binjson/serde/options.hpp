#pragma once

#include "binjson/core/common.hpp"

#include <cstddef>

namespace binjson::serde {

/**
 * @brief Encoder/Decoder 的运行期配置。
 */
struct Options final {
  // 最大嵌套深度（根节点深度为 0）；超出时以 core::errc::depth_exceeded 失败。
  std::size_t max_depth{core::kDefaultMaxDepth};
};

}  // namespace binjson::serde
