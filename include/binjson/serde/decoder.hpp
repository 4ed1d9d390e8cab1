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
#include <vector>

namespace binjson::serde {

class SeqAccess;
class MapAccess;
class EnumAccess;

/**
 * @brief 形状描述方提供的“构建回调集合”。
 *
 * Decoder 按 Value 的实际变体调用对应的 visit_*；未覆盖的 visit_* 默认返回
 * Expected(expecting(), <收到的变体标签>)。
 */
class Visitor {
 public:
  virtual ~Visitor() = default;

  // 期望形状的可读描述（用作 Expected 错误的第一个字段）。
  [[nodiscard]] virtual std::string expecting() const = 0;

  virtual core::Error visit_none();
  virtual core::Error visit_some(Decoder& dec);
  virtual core::Error visit_unit();
  virtual core::Error visit_bool(bool v);
  virtual core::Error visit_i64(std::int64_t v);
  virtual core::Error visit_f64(double v);
  virtual core::Error visit_string(std::string v);
  virtual core::Error visit_bytes(std::vector<byte> v);
  virtual core::Error visit_seq(SeqAccess& seq);
  virtual core::Error visit_map(MapAccess& map);
  virtual core::Error visit_enum(EnumAccess& access);

 protected:
  [[nodiscard]] core::Error invalid_type(std::string_view found) const;
};

/**
 * @brief 自上而下消费一棵 Value 树的遍历器（Serde<T>::deserialize 的数据源）。
 *
 * 约定：
 * - Decoder 独占其 Value；任意 decode_* 都会取走该值，再次解码返回 Eof；
 * - 嵌套容器的元素以深度 +1 的子 Decoder 提供；深度超过 Options::max_depth 时
 *   返回 core::errc::depth_exceeded。
 */
class Decoder final {
 public:
  explicit Decoder(Value value, const Options& options = {}, std::size_t depth = 0)
    : value_(std::move(value)), options_(options), depth_(depth) {}

  // 没有可用值的 Decoder：任何解码都返回 Eof。
  [[nodiscard]] static Decoder empty(const Options& options = {}, std::size_t depth = 0) {
    return Decoder(std::nullopt, options, depth);
  }

  // 查看尚未取走的值（已取走或不存在时为 nullptr）。
  [[nodiscard]] const Value* peek() const noexcept { return value_ ? &*value_ : nullptr; }
  [[nodiscard]] const Options& options() const noexcept { return options_; }
  [[nodiscard]] std::size_t depth() const noexcept { return depth_; }

  /**
   * @brief 按 Value 的实际变体分派到 visitor。
   *
   * Null -> visit_none；Boolean -> visit_bool；Blob -> visit_bytes；Array -> visit_seq；
   * Integer -> visit_i64；Float -> visit_f64；Object -> visit_map；String -> visit_string。
   */
  core::Error decode_any(Visitor& visitor);

  // Null -> visit_none；其它 -> visit_some(*this)（值保持未消费，由内层继续解码）。
  core::Error decode_option(Visitor& visitor);

  /**
   * @brief 解码带标签联合。
   *
   * 接受裸 String（unit 分支）或恰好一个键的 Object；
   * 空 Object -> Expected("variant name", "empty object")；
   * 多键 -> Expected("map with a single key", "extra key \"<k>\"")；
   * 其它 -> Expected("an enum", <变体标签>)。
   */
  core::Error decode_enum(Visitor& visitor);

  template <Deserializable T>
  core::Error decode(T& out) {
    return Serde<T>::deserialize(*this, out);
  }

 private:
  Decoder(std::optional<Value> value, const Options& options, std::size_t depth)
    : value_(std::move(value)), options_(options), depth_(depth) {}

  [[nodiscard]] core::Error check_depth() const;
  [[nodiscard]] std::optional<Value> take() noexcept;

  std::optional<Value> value_;
  Options options_{};
  std::size_t depth_{0};
};

/**
 * @brief Array 元素的顺序访问器。
 */
class SeqAccess final {
 public:
  SeqAccess(Array items, const Options& options, std::size_t depth)
    : items_(std::move(items)), options_(options), depth_(depth) {}

  [[nodiscard]] std::size_t remaining() const noexcept { return items_.size() - next_; }

  // 下一个元素的 Decoder；没有更多元素时返回 std::nullopt。
  [[nodiscard]] std::optional<Decoder> next_decoder();

  // 没有更多元素时 out 被置空并返回成功。
  template <Deserializable T>
  core::Error next_element(std::optional<T>& out);

 private:
  Array items_;
  std::size_t next_{0};
  Options options_{};
  std::size_t depth_{0};
};

/**
 * @brief Object 条目的访问器：键以 String Value 的形式交给键的形状描述。
 *
 * next_value 之前必须先取到一个键，否则返回 Eof。
 */
class MapAccess final {
 public:
  MapAccess(Object::container_type entries, const Options& options, std::size_t depth)
    : entries_(std::move(entries)), options_(options), depth_(depth) {}

  [[nodiscard]] std::size_t remaining() const noexcept { return entries_.size() - next_; }

  [[nodiscard]] std::optional<Decoder> next_key_decoder();
  [[nodiscard]] Decoder next_value_decoder();

  template <Deserializable K>
  core::Error next_key(std::optional<K>& out);

  template <Deserializable V>
  core::Error next_value(V& out);

 private:
  Object::container_type entries_;
  std::size_t next_{0};
  std::optional<Value> pending_value_;
  Options options_{};
  std::size_t depth_{0};
};

/**
 * @brief 已匹配标签的联合分支访问器（由 Decoder::decode_enum 交给 visit_enum）。
 */
class EnumAccess final {
 public:
  // 分支名（裸 String 本身，或单键 Object 的键）。
  [[nodiscard]] const std::string& variant() const noexcept { return variant_; }

  // 分支来源的变体标签（"type string" 或 "type object"）。
  [[nodiscard]] const char* source_description() const noexcept { return kind_description(source_); }

  [[nodiscard]] bool has_payload() const noexcept { return payload_.has_value(); }

  // 以 T 的形状解码分支名（分支名被当作 String Value）。
  template <Deserializable T>
  core::Error variant_as(T& out) {
    return Decoder(Value(variant_), options_, depth_).decode(out);
  }

  // unit 分支：若带有负载，按动态 Value 解码后丢弃。
  core::Error unit_variant();

  // 单负载分支：没有负载时返回 Eof。
  template <Deserializable T>
  core::Error newtype_variant(T& out);

  // 位置负载分支：负载必须是 Array（否则 Expected("a tuple", ...)）；空 Array 调用 visit_unit。
  core::Error tuple_variant(std::size_t len, Visitor& visitor);

  // 具名负载分支：负载必须是 Object（否则 Expected("a struct", ...)）。
  core::Error struct_variant(Visitor& visitor);

 private:
  friend class Decoder;

  EnumAccess(std::string variant, std::optional<Value> payload, ValueKind source, const Options& options,
             std::size_t depth)
    : variant_(std::move(variant)),
      payload_(std::move(payload)),
      source_(source),
      options_(options),
      depth_(depth) {}

  [[nodiscard]] std::optional<Value> take_payload() noexcept;

  std::string variant_;
  std::optional<Value> payload_;
  ValueKind source_{ValueKind::string};
  Options options_{};
  // 负载所在深度（外层 Decoder 深度 + 1）。
  std::size_t depth_{0};
};

/**
 * @brief 动态目标：把任意输入原样重建为 Value（Serde<Value> 与丢弃负载时使用）。
 */
class ValueVisitor final : public Visitor {
 public:
  explicit ValueVisitor(Value& out) noexcept : out_(out) {}

  [[nodiscard]] std::string expecting() const override { return "any value"; }

  core::Error visit_none() override;
  core::Error visit_some(Decoder& dec) override;
  core::Error visit_unit() override;
  core::Error visit_bool(bool v) override;
  core::Error visit_i64(std::int64_t v) override;
  core::Error visit_f64(double v) override;
  core::Error visit_string(std::string v) override;
  core::Error visit_bytes(std::vector<byte> v) override;
  core::Error visit_seq(SeqAccess& seq) override;
  core::Error visit_map(MapAccess& map) override;

 private:
  Value& out_;
};

namespace detail {

// text 恰好是一个合法 UTF-8 编码的码点时返回 true。
[[nodiscard]] bool decode_single_utf8(std::string_view text, char32_t& out) noexcept;

}  // namespace detail

template <Deserializable T>
core::Error SeqAccess::next_element(std::optional<T>& out) {
  auto dec = next_decoder();
  if (!dec) {
    out.reset();
    return {};
  }
  T value{};
  if (auto err = dec->decode(value)) {
    return err;
  }
  out = std::move(value);
  return {};
}

template <Deserializable K>
core::Error MapAccess::next_key(std::optional<K>& out) {
  auto dec = next_key_decoder();
  if (!dec) {
    out.reset();
    return {};
  }
  K key{};
  if (auto err = dec->decode(key)) {
    return err;
  }
  out = std::move(key);
  return {};
}

template <Deserializable V>
core::Error MapAccess::next_value(V& out) {
  auto dec = next_value_decoder();
  return dec.decode(out);
}

template <Deserializable T>
core::Error EnumAccess::newtype_variant(T& out) {
  auto payload = take_payload();
  if (!payload) {
    return core::Error::eof();
  }
  return Decoder(std::move(*payload), options_, depth_).decode(out);
}

}  // namespace binjson::serde
