#pragma once

#include "binjson/core/error.hpp"
#include "binjson/serde/fwd.hpp"
#include "binjson/serde/options.hpp"
#include "binjson/value/value.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace binjson::serde {

class SeqEncoder;
class MapEncoder;
class StructEncoder;
class TupleVariantEncoder;
class StructVariantEncoder;

/**
 * @brief 把任意类型值描述为 Value 的遍历器（Serde<T>::serialize 的回调目标）。
 *
 * 形状映射（固定、二进制兼容）：
 * - bool -> Boolean；任意宽度整数 -> Integer（无符号按位模式重解释为 int64）；
 * - 浮点 -> Float；单个字符/文本 -> String；字节序列 -> Blob；
 * - 缺省 optional -> Null；存在的 optional(x) -> encode(x)（无包装）；
 * - unit/零字段标记类型 -> 空 Array；序列/元组 -> Array；
 * - map -> Object（键必须编码为 String）；具名字段结构 -> Object；
 * - 变体：unit -> String(tag)；单负载 -> {tag: 负载}；位置负载 -> {tag: Array}；具名负载 -> {tag: Object}。
 *
 * Encoder 是不可变的小对象：嵌套值通过深度 +1 的子 Encoder 编码。
 */
class Encoder final {
 public:
  explicit Encoder(const Options& options = {}) noexcept : options_(options) {}

  // 非人类可读表示：下游可据此为自身原语选择紧凑编码。
  [[nodiscard]] bool is_human_readable() const noexcept { return false; }
  [[nodiscard]] const Options& options() const noexcept { return options_; }
  [[nodiscard]] std::size_t depth() const noexcept { return depth_; }

  core::Error encode_bool(bool v, Value& out) const;
  core::Error encode_i64(std::int64_t v, Value& out) const;
  core::Error encode_u64(std::uint64_t v, Value& out) const;
  core::Error encode_f64(double v, Value& out) const;
  core::Error encode_char(char32_t c, Value& out) const;
  core::Error encode_string(std::string_view v, Value& out) const;
  core::Error encode_bytes(bytes_view v, Value& out) const;
  core::Error encode_none(Value& out) const;
  core::Error encode_unit(Value& out) const;
  core::Error encode_unit_variant(std::string_view variant, Value& out) const;

  template <Serializable T>
  core::Error encode_some(const T& v, Value& out) const;

  template <Serializable T>
  core::Error encode_newtype_variant(std::string_view variant, const T& v, Value& out) const;

  /**
   * @brief 在当前深度编码一个值（检查深度上限后转发到 Serde<T>::serialize）。
   */
  template <Serializable T>
  core::Error encode(const T& v, Value& out) const;

  [[nodiscard]] SeqEncoder encode_seq(std::size_t len_hint = 0) const;
  [[nodiscard]] MapEncoder encode_map(std::size_t len_hint = 0) const;
  [[nodiscard]] StructEncoder encode_struct(std::size_t len) const;
  [[nodiscard]] TupleVariantEncoder encode_tuple_variant(std::string_view variant, std::size_t len) const;
  [[nodiscard]] StructVariantEncoder encode_struct_variant(std::string_view variant, std::size_t len) const;

 private:
  Encoder(const Options& options, std::size_t depth) noexcept : options_(options), depth_(depth) {}

  [[nodiscard]] Encoder nested() const noexcept { return Encoder(options_, depth_ + 1); }
  [[nodiscard]] core::Error depth_error() const;

  Options options_{};
  std::size_t depth_{0};
};

class SeqEncoder final {
 public:
  template <Serializable T>
  core::Error element(const T& v);

  core::Error end(Value& out);

 private:
  friend class Encoder;
  SeqEncoder(Encoder child, std::size_t len_hint);

  Encoder child_;
  Array items_;
};

class TupleVariantEncoder final {
 public:
  template <Serializable T>
  core::Error field(const T& v);

  core::Error end(Value& out);

 private:
  friend class Encoder;
  TupleVariantEncoder(Encoder child, std::string_view variant, std::size_t len);

  Encoder child_;
  std::string variant_;
  Array items_;
};

/**
 * @brief map 编码：键必须编码为 String，否则返回 Expected("type str", <键的类型标签>)。
 *
 * value() 之前未调用 key() 时使用空字符串作为键。
 */
class MapEncoder final {
 public:
  template <Serializable K>
  core::Error key(const K& k);

  template <Serializable V>
  core::Error value(const V& v);

  template <Serializable K, Serializable V>
  core::Error entry(const K& k, const V& v);

  core::Error end(Value& out);

 private:
  friend class Encoder;
  MapEncoder(Encoder child, std::size_t len_hint);

  core::Error accept_key(Value key);

  Encoder child_;
  Object entries_;
  std::optional<std::string> pending_key_;
};

class StructEncoder final {
 public:
  template <Serializable T>
  core::Error field(std::string_view name, const T& v);

  core::Error end(Value& out);

 private:
  friend class Encoder;
  StructEncoder(Encoder child, std::size_t len);

  Encoder child_;
  Object fields_;
};

class StructVariantEncoder final {
 public:
  template <Serializable T>
  core::Error field(std::string_view name, const T& v);

  core::Error end(Value& out);

 private:
  friend class Encoder;
  StructVariantEncoder(Encoder child, std::string_view variant, std::size_t len);

  Encoder child_;
  std::string variant_;
  Object fields_;
};

template <Serializable T>
core::Error Encoder::encode_some(const T& v, Value& out) const {
  return encode(v, out);
}

template <Serializable T>
core::Error Encoder::encode_newtype_variant(std::string_view variant, const T& v, Value& out) const {
  Value payload;
  if (auto err = nested().encode(v, payload)) {
    return err;
  }
  Object wrapper;
  wrapper.insert_or_assign(std::string(variant), std::move(payload));
  out = Value(std::move(wrapper));
  return {};
}

template <Serializable T>
core::Error Encoder::encode(const T& v, Value& out) const {
  if (depth_ > options_.max_depth) {
    return depth_error();
  }
  return Serde<T>::serialize(v, *this, out);
}

template <Serializable T>
core::Error SeqEncoder::element(const T& v) {
  Value item;
  if (auto err = child_.encode(v, item)) {
    return err;
  }
  items_.push_back(std::move(item));
  return {};
}

template <Serializable T>
core::Error TupleVariantEncoder::field(const T& v) {
  Value item;
  if (auto err = child_.encode(v, item)) {
    return err;
  }
  items_.push_back(std::move(item));
  return {};
}

template <Serializable K>
core::Error MapEncoder::key(const K& k) {
  Value encoded;
  if (auto err = child_.encode(k, encoded)) {
    return err;
  }
  return accept_key(std::move(encoded));
}

template <Serializable V>
core::Error MapEncoder::value(const V& v) {
  Value encoded;
  if (auto err = child_.encode(v, encoded)) {
    return err;
  }
  entries_.insert_or_assign(std::move(pending_key_).value_or(std::string{}), std::move(encoded));
  pending_key_.reset();
  return {};
}

template <Serializable K, Serializable V>
core::Error MapEncoder::entry(const K& k, const V& v) {
  if (auto err = key(k)) {
    return err;
  }
  return value(v);
}

template <Serializable T>
core::Error StructEncoder::field(std::string_view name, const T& v) {
  Value encoded;
  if (auto err = child_.encode(v, encoded)) {
    return err;
  }
  fields_.insert_or_assign(std::string(name), std::move(encoded));
  return {};
}

template <Serializable T>
core::Error StructVariantEncoder::field(std::string_view name, const T& v) {
  Value encoded;
  if (auto err = child_.encode(v, encoded)) {
    return err;
  }
  fields_.insert_or_assign(std::string(name), std::move(encoded));
  return {};
}

}  // namespace binjson::serde
