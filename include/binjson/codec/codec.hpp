#pragma once

#include "binjson/value/value.hpp"

#include <cstddef>
#include <cstdint>
#include <system_error>
#include <vector>

namespace binjson::codec {

using byte = core::byte;
using bytes_view = core::bytes_view;
using mutable_bytes_view = core::mutable_bytes_view;

/**
 * @brief Value 二进制编码（与 bincode 2 standard 配置字节兼容）。
 *
 * 布局：
 * - 变长无符号整数：< 251 单字节；251 + u16 LE；252 + u32 LE；253 + u64 LE；
 *   254（u128 标记）对 64 位目标非法，255 非法；
 * - 有符号整数：zig-zag 后按变长无符号整数编码；
 * - Value 判别值：变长整数（0..7，顺序见 ValueKind）；
 * - Boolean：1 字节 0/1；Float：8 字节 IEEE-754 小端；
 * - Blob/String：长度 + 字节（String 必须是合法 UTF-8）；
 * - Array：元素个数 + 元素；Object：条目个数 + (String 键, Value) 对。
 */
enum class errc : int {
  ok = 0,
  truncated = 1,
  invalid_tag = 2,
  invalid_bool = 3,
  invalid_utf8 = 4,
  invalid_integer = 5,
  length_overflow = 6,
  depth_exceeded = 7,
  buffer_overflow = 8,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

// 与 serde::Options 的默认深度一致，保证 to_bytes 的输出能被 from_bytes 读回。
inline constexpr std::size_t kDefaultMaxDecodeDepth = core::kDefaultMaxDepth;
inline constexpr std::size_t kDefaultMaxContainerLength = 16u * 1024u * 1024u;

/**
 * @brief 解码资源上限（用于限制不可信输入的资源消耗）。
 */
struct DecodeLimits final {
  // 最大嵌套深度（根节点深度为 0）。
  std::size_t max_depth{kDefaultMaxDecodeDepth};

  // 单个 Array/Object/Blob/String 的最大元素（字节）数。
  std::size_t max_container_length{kDefaultMaxContainerLength};
};

/**
 * @brief 计算 Value 编码后的字节数。
 */
std::error_code encoded_size(const Value& value, std::size_t& out_size) noexcept;

/**
 * @brief 编码 Value 并追加到 out（内部会一次性 reserve/resize，避免反复 realloc）。
 *
 * 失败时 out 保持调用前的内容。
 */
std::error_code encode(const Value& value, std::vector<byte>& out) noexcept;

/**
 * @brief 编码 Value 到固定缓冲区。
 *
 * 注意：
 * - out 过小会返回 errc::buffer_overflow
 * - 成功时 written 为写入字节数
 */
std::error_code encode_to(mutable_bytes_view out, const Value& value, std::size_t& written) noexcept;

/**
 * @brief 从输入缓冲区解码一个 Value。
 *
 * 成功时：
 * - out 被填充
 * - consumed 为消耗的输入字节数（尾随字节不视为错误）
 *
 * 失败时：
 * - 返回非零 error_code；out 不变，consumed 为 0
 */
std::error_code decode_one(bytes_view in, Value& out, std::size_t& consumed, const DecodeLimits& limits = {}) noexcept;

}  // namespace binjson::codec

namespace std {
template <>
struct is_error_code_enum<binjson::codec::errc> : true_type {};
}  // namespace std
