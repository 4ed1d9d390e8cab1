#pragma once

#include "binjson/value/value.hpp"

#include <cstddef>
#include <string>

namespace binjson::utils {

/**
 * @brief Value 树的可读化输出（调试/日志用途）。
 *
 * 格式：N、B true、BLOB[n] xx xx、I 42、F 1.5、S[n] "text"、A[n] { ... }、O[n] { key: ... }。
 * 超长内容默认截断；输出不是可回读的文本格式（文本形式见 utils/json.hpp）。
 */
struct ValueDumpOptions final {
    // 递归最大深度（0 表示只输出根节点）。
    std::size_t max_depth{16};

    // Array/Object 最大输出元素数（0 表示不限制）。
    std::size_t max_container_items{128};

    // String/Blob 最大输出字节数（0 表示不限制）。
    std::size_t max_payload_bytes{256};

    // Array/Object 是否使用多行缩进格式。
    bool multiline{true};

    // 每层缩进空格数（multiline=true 时生效）。
    std::size_t indent_spaces{2};

    // 是否输出 ANSI 颜色控制码（写入日志/文件时建议关闭）。
    bool enable_color{false};
};

[[nodiscard]] std::string dump_value(const Value &value, ValueDumpOptions options = {});

} // namespace binjson::utils
