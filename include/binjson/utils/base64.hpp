#pragma once

#include "binjson/core/common.hpp"

#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace binjson::utils {

/**
 * @brief 标准 base64（RFC 4648，字母表 A-Z a-z 0-9 + /，带 '=' 填充）。
 *
 * 用于 Blob 的文本形式。
 */
[[nodiscard]] std::string encode_base64(binjson::core::bytes_view bytes);

/**
 * @brief 解析 base64 文本（必须带完整填充，不接受空白）。
 *
 * 失败返回 std::errc::invalid_argument，out 保持不变。
 */
std::error_code decode_base64(std::string_view text, std::vector<binjson::core::byte> &out) noexcept;

} // namespace binjson::utils
