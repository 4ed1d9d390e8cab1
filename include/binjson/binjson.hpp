#pragma once

#include "binjson/codec/codec.hpp"
#include "binjson/core/error.hpp"
#include "binjson/core/log.hpp"
#include "binjson/serde/decoder.hpp"
#include "binjson/serde/encoder.hpp"
#include "binjson/serde/fields.hpp"
#include "binjson/serde/options.hpp"
#include "binjson/serde/traits.hpp"
#include "binjson/value/value.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace binjson {

using core::Error;
using serde::Options;

/**
 * @brief 把二进制编解码器包装进 core::Error。
 *
 * 编解码器失败统一报告为 core::errc::binary_codec，原始错误码见 Error::cause()。
 */
Error encode_value(const Value& value, std::vector<byte>& out);
Error decode_value(bytes_view in, Value& out, std::size_t& consumed, const codec::DecodeLimits& limits = {});

/**
 * @brief 把类型化值转换为 Value。失败时 out 保持不变。
 */
template <serde::Serializable T>
Error to_value(const T& v, Value& out, const Options& options = {}) {
  Value tmp;
  serde::Encoder enc(options);
  if (auto err = enc.encode(v, tmp)) {
    return err;
  }
  out = std::move(tmp);
  return {};
}

/**
 * @brief 由 Value 重建类型化值（消费 value）。失败时 out 保持不变。
 */
template <serde::Deserializable T>
Error from_value(Value value, T& out, const Options& options = {}) {
  T tmp{};
  serde::Decoder dec(std::move(value), options);
  if (auto err = dec.decode(tmp)) {
    return err;
  }
  out = std::move(tmp);
  return {};
}

/**
 * @brief to_value 后再做二进制编码；结果追加到 out（失败时 out 保持调用前内容）。
 */
template <serde::Serializable T>
Error to_bytes(const T& v, std::vector<byte>& out, const Options& options = {}) {
  Value tree;
  if (auto err = to_value(v, tree, options)) {
    return err;
  }
  return encode_value(tree, out);
}

/**
 * @brief 二进制解码一个 Value 后再 from_value；尾随字节被忽略。
 *
 * 解码深度上限取 options.max_depth，与 to_bytes 的编码上限一致。
 */
template <serde::Deserializable T>
Error from_bytes(bytes_view in, T& out, const Options& options = {}) {
  codec::DecodeLimits limits;
  limits.max_depth = options.max_depth;

  Value tree;
  std::size_t consumed = 0;
  if (auto err = decode_value(in, tree, consumed, limits)) {
    return err;
  }
  return from_value(std::move(tree), out, options);
}

}  // namespace binjson
