#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#ifndef BINJSON_PRESERVE_ORDER
#define BINJSON_PRESERVE_ORDER 0
#endif

namespace binjson::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

/**
 * @brief Object 的键遍历顺序（构建期配置，见 CMake 选项 BINJSON_PRESERVE_ORDER）。
 *
 * - sorted：按键升序遍历，与插入顺序无关（默认）；
 * - insertion：按插入顺序遍历。
 */
enum class KeyOrder : std::uint8_t {
  sorted = 0,
  insertion = 1,
};

inline constexpr KeyOrder kKeyOrder = BINJSON_PRESERVE_ORDER ? KeyOrder::insertion : KeyOrder::sorted;

// Encoder/Decoder 默认最大嵌套深度：防止恶意输入构造极深嵌套导致栈溢出。
inline constexpr std::size_t kDefaultMaxDepth = 128;

}  // namespace binjson::core
