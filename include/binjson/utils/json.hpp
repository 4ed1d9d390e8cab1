#pragma once

#include "binjson/core/error.hpp"
#include "binjson/value/value.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace binjson::utils {

using Json = nlohmann::json;

/**
 * @brief Value -> JSON（总是成功）。
 *
 * - Blob 输出为 base64 字符串；
 * - 非有限 Float 降级为字符串 "NaN" / "inf" / "-inf"；
 * - 其余变体与 JSON 类型一一对应。
 *
 * 注意：文本形式不可逆（Blob 与 String、非有限 Float 与 String 无法区分）。
 */
[[nodiscard]] Json to_json(const Value &value);

/**
 * @brief JSON -> Value。失败时 out 保持不变。
 *
 * 整数 -> Integer（超出 int64 的无符号数按位模式重解释）；小数 -> Float；
 * nlohmann 二进制 -> Blob。嵌套深度超过 max_depth 时返回 core::errc::depth_exceeded。
 */
core::Error from_json(const Json &json, Value &out, std::size_t max_depth = core::kDefaultMaxDepth);

// indent < 0 输出紧凑文本；字符串不是合法 UTF-8 时返回 core::errc::custom。
core::Error to_json_text(const Value &value, std::string &out, int indent = -1);

// 文本不是合法 JSON 时返回 core::errc::custom（消息为解析器的诊断信息）；
// 嵌套过深时返回 core::errc::depth_exceeded。失败时 out 保持不变。
core::Error from_json_text(std::string_view text, Value &out, std::size_t max_depth = core::kDefaultMaxDepth);

} // namespace binjson::utils
