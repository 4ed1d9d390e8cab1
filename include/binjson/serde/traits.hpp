#pragma once

#include "binjson/serde/decoder.hpp"
#include "binjson/serde/encoder.hpp"
#include "binjson/serde/fields.hpp"

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace binjson::serde {

/**
 * @brief 零字段标记类型（unit struct）：编码为空 Array，解码接受 unit 或空 Array。
 *
 * 用户类型可特化为 true_type（类型必须可默认构造）。
 */
template <class T>
struct is_unit_struct : std::false_type {};

template <>
struct is_unit_struct<std::monostate> : std::true_type {};

/**
 * @brief C++ 枚举的名字表（unit-only 带标签联合）。
 *
 * 特化示例：
 *   template <> struct EnumNames<Color> {
 *     static constexpr std::array<std::pair<Color, std::string_view>, 2> entries{{
 *       {Color::red, "Red"}, {Color::green, "Green"}}};
 *   };
 */
template <class E>
struct EnumNames {};

template <class E>
concept NamedEnum = std::is_enum_v<E> && requires { EnumNames<E>::entries; };

namespace detail {

template <class T>
inline constexpr bool is_char_v = std::is_same_v<T, char> || std::is_same_v<T, char8_t> ||
                                  std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;

template <class T>
inline constexpr bool is_integer_v =
  std::integral<T> && !std::is_same_v<T, bool> && !is_char_v<T> && !std::is_same_v<T, wchar_t>;

template <class T>
[[nodiscard]] constexpr std::string_view integer_name() noexcept {
  if constexpr (std::is_signed_v<T>) {
    if constexpr (sizeof(T) == 1) {
      return "i8";
    } else if constexpr (sizeof(T) == 2) {
      return "i16";
    } else if constexpr (sizeof(T) == 4) {
      return "i32";
    } else {
      return "i64";
    }
  } else {
    if constexpr (sizeof(T) == 1) {
      return "u8";
    } else if constexpr (sizeof(T) == 2) {
      return "u16";
    } else if constexpr (sizeof(T) == 4) {
      return "u32";
    } else {
      return "u64";
    }
  }
}

template <class T>
[[nodiscard]] constexpr std::string_view char_name() noexcept {
  if constexpr (std::is_same_v<T, char>) {
    return "char";
  } else if constexpr (std::is_same_v<T, char8_t>) {
    return "char8_t";
  } else if constexpr (std::is_same_v<T, char16_t>) {
    return "char16_t";
  } else {
    return "char32_t";
  }
}

// 单字节字符按 Latin-1 码点处理，保证任意字节值都能往返。
template <class T>
inline constexpr char32_t kMaxCharCodePoint = sizeof(T) == 1 ? 0xFF : (sizeof(T) == 2 ? 0xFFFF : 0x10FFFF);

template <class T>
class IntegerVisitor final : public Visitor {
 public:
  explicit IntegerVisitor(T& out) noexcept : out_(out) {}

  [[nodiscard]] std::string expecting() const override { return "type integer"; }

  core::Error visit_i64(std::int64_t v) override {
    if constexpr (sizeof(T) == sizeof(std::int64_t)) {
      // 64 位目标：无符号按位模式还原（与编码侧的重解释对称）。
      out_ = static_cast<T>(v);
      return {};
    } else {
      if (!std::in_range<T>(v)) {
        return core::Error::expected("integer in range of " + std::string(integer_name<T>()),
                                     "integer " + std::to_string(v));
      }
      out_ = static_cast<T>(v);
      return {};
    }
  }

 private:
  T& out_;
};

template <class T>
class FloatVisitor final : public Visitor {
 public:
  explicit FloatVisitor(T& out) noexcept : out_(out) {}

  [[nodiscard]] std::string expecting() const override { return "type float"; }

  core::Error visit_f64(double v) override {
    out_ = static_cast<T>(v);
    return {};
  }

  core::Error visit_i64(std::int64_t v) override {
    out_ = static_cast<T>(v);
    return {};
  }

 private:
  T& out_;
};

template <class T>
class CharVisitor final : public Visitor {
 public:
  explicit CharVisitor(T& out) noexcept : out_(out) {}

  [[nodiscard]] std::string expecting() const override { return "a single character"; }

  core::Error visit_string(std::string v) override {
    char32_t cp = 0;
    if (!decode_single_utf8(v, cp)) {
      return invalid_type("string \"" + v + "\"");
    }
    if (cp > kMaxCharCodePoint<T>) {
      return core::Error::expected("character in range of " + std::string(char_name<T>()),
                                   "string \"" + v + "\"");
    }
    out_ = static_cast<T>(cp);
    return {};
  }

 private:
  T& out_;
};

class BoolVisitor final : public Visitor {
 public:
  explicit BoolVisitor(bool& out) noexcept : out_(out) {}

  [[nodiscard]] std::string expecting() const override { return "type boolean"; }

  core::Error visit_bool(bool v) override {
    out_ = v;
    return {};
  }

 private:
  bool& out_;
};

class StringVisitor final : public Visitor {
 public:
  explicit StringVisitor(std::string& out) noexcept : out_(out) {}

  [[nodiscard]] std::string expecting() const override { return "type string"; }

  core::Error visit_string(std::string v) override {
    out_ = std::move(v);
    return {};
  }

 private:
  std::string& out_;
};

class UnitVisitor final : public Visitor {
 public:
  [[nodiscard]] std::string expecting() const override { return "unit"; }

  core::Error visit_unit() override { return {}; }

  core::Error visit_seq(SeqAccess& seq) override {
    if (seq.remaining() != 0) {
      return core::Error::expected("an empty array", "array of length " + std::to_string(seq.remaining()));
    }
    return {};
  }
};

// 取下一个元素写入 out；元素不足时返回 Eof。
template <class E>
core::Error next_into(SeqAccess& seq, E& out) {
  std::optional<E> item;
  if (auto err = seq.next_element(item)) {
    return err;
  }
  if (!item) {
    return core::Error::eof();
  }
  out = std::move(*item);
  return {};
}

/**
 * @brief 定长序列（std::array / std::pair / std::tuple）：要求元素个数完全一致。
 */
template <class Tup>
class TupleLikeVisitor final : public Visitor {
 public:
  static constexpr std::size_t kLength = std::tuple_size_v<Tup>;

  explicit TupleLikeVisitor(Tup& out) noexcept : out_(out) {}

  [[nodiscard]] std::string expecting() const override { return "array of length " + std::to_string(kLength); }

  core::Error visit_unit() override {
    if constexpr (kLength == 0) {
      return {};
    } else {
      return core::Error::expected(expecting(), "array of length 0");
    }
  }

  core::Error visit_seq(SeqAccess& seq) override {
    if (seq.remaining() != kLength) {
      return core::Error::expected(expecting(), "array of length " + std::to_string(seq.remaining()));
    }
    core::Error err;
    std::apply([&](auto&... elems) { (void)(... && !(err = next_into(seq, elems))); }, out_);
    return err;
  }

 private:
  Tup& out_;
};

template <class C>
class SeqVisitor final : public Visitor {
 public:
  explicit SeqVisitor(C& out) noexcept : out_(out) {}

  [[nodiscard]] std::string expecting() const override { return "type array"; }

  // 长度为 0 的序列与 unit 形状等价。
  core::Error visit_unit() override {
    out_.clear();
    return {};
  }

  core::Error visit_seq(SeqAccess& seq) override {
    using Elem = typename C::value_type;
    C result;
    if constexpr (requires(C& c, std::size_t n) { c.reserve(n); }) {
      result.reserve(seq.remaining());
    }
    for (;;) {
      std::optional<Elem> item;
      if (auto err = seq.next_element(item)) {
        return err;
      }
      if (!item) {
        break;
      }
      if constexpr (requires(C& c, Elem&& e) { c.push_back(std::move(e)); }) {
        result.push_back(std::move(*item));
      } else {
        result.insert(std::move(*item));
      }
    }
    out_ = std::move(result);
    return {};
  }

 private:
  C& out_;
};

template <class M>
class MapVisitor final : public Visitor {
 public:
  explicit MapVisitor(M& out) noexcept : out_(out) {}

  [[nodiscard]] std::string expecting() const override { return "type object"; }

  core::Error visit_map(MapAccess& map) override {
    using K = typename M::key_type;
    using V = typename M::mapped_type;
    M result;
    for (;;) {
      std::optional<K> key;
      if (auto err = map.next_key(key)) {
        return err;
      }
      if (!key) {
        break;
      }
      V value{};
      if (auto err = map.next_value(value)) {
        return err;
      }
      result.insert_or_assign(std::move(*key), std::move(value));
    }
    out_ = std::move(result);
    return {};
  }

 private:
  M& out_;
};

template <class T>
class OptionVisitor final : public Visitor {
 public:
  explicit OptionVisitor(std::optional<T>& out) noexcept : out_(out) {}

  [[nodiscard]] std::string expecting() const override { return "option"; }

  core::Error visit_none() override {
    out_.reset();
    return {};
  }

  core::Error visit_some(Decoder& dec) override {
    T value{};
    if (auto err = dec.decode(value)) {
      return err;
    }
    out_ = std::move(value);
    return {};
  }

 private:
  std::optional<T>& out_;
};

template <class E>
class EnumVisitor final : public Visitor {
 public:
  explicit EnumVisitor(E& out) noexcept : out_(out) {}

  [[nodiscard]] std::string expecting() const override { return "an enum"; }

  core::Error visit_enum(EnumAccess& access) override {
    for (const auto& [value, name] : EnumNames<E>::entries) {
      if (name == access.variant()) {
        if (auto err = access.unit_variant()) {
          return err;
        }
        out_ = value;
        return {};
      }
    }
    return core::Error::unknown(access.variant());
  }

 private:
  E& out_;
};

// ---- std::variant 的分支类型 ----

template <class T>
struct is_std_tuple : std::false_type {};
template <class... Ts>
struct is_std_tuple<std::tuple<Ts...>> : std::true_type {};

template <class C>
concept TaggedCase = requires {
  { C::tag } -> std::convertible_to<std::string_view>;
};

template <class C>
concept StructCase = TaggedCase<C> && Described<C>;

template <class C>
concept PayloadCase = TaggedCase<C> && !Described<C> && requires(C& c) { c.value; };

template <class C>
concept TupleCase = PayloadCase<C> && is_std_tuple<std::remove_cvref_t<decltype(std::declval<C&>().value)>>::value;

template <class C>
concept NewtypeCase = PayloadCase<C> && !TupleCase<C>;

template <class C>
concept UnitCase = TaggedCase<C> && !Described<C> && !PayloadCase<C>;

template <class C>
core::Error encode_case(const C& c, const Encoder& enc, Value& out) {
  if constexpr (StructCase<C>) {
    const auto refs = C::describe(c);
    auto builder = enc.encode_struct_variant(C::tag, std::tuple_size_v<std::remove_const_t<decltype(refs)>>);
    if (auto err = encode_fields(builder, refs)) {
      return err;
    }
    return builder.end(out);
  } else if constexpr (TupleCase<C>) {
    using Payload = std::remove_cvref_t<decltype(c.value)>;
    auto builder = enc.encode_tuple_variant(C::tag, std::tuple_size_v<Payload>);
    core::Error err;
    std::apply([&](const auto&... elems) { (void)(... && !(err = builder.field(elems))); }, c.value);
    if (err) {
      return err;
    }
    return builder.end(out);
  } else if constexpr (NewtypeCase<C>) {
    return enc.encode_newtype_variant(C::tag, c.value, out);
  } else {
    return enc.encode_unit_variant(C::tag, out);
  }
}

template <class... Cs>
class VariantVisitor final : public Visitor {
 public:
  using variant_type = std::variant<Cs...>;

  explicit VariantVisitor(variant_type& out) noexcept : out_(out) {}

  [[nodiscard]] std::string expecting() const override { return "an enum"; }

  core::Error visit_enum(EnumAccess& access) override {
    core::Error err;
    bool matched = false;
    [&]<std::size_t... I>(std::index_sequence<I...>) {
      (void)(... || (std::variant_alternative_t<I, variant_type>::tag == access.variant()
                       ? (matched = true, err = decode_case<I>(access), true)
                       : false));
    }(std::index_sequence_for<Cs...>{});
    if (!matched) {
      return core::Error::unknown(access.variant());
    }
    return err;
  }

 private:
  template <std::size_t I>
  core::Error decode_case(EnumAccess& access) {
    using C = std::variant_alternative_t<I, variant_type>;
    C c{};
    core::Error err;
    if constexpr (StructCase<C>) {
      StructVisitor<C> visitor(c);
      err = access.struct_variant(visitor);
    } else if constexpr (TupleCase<C>) {
      using Payload = std::remove_cvref_t<decltype(c.value)>;
      TupleLikeVisitor<Payload> visitor(c.value);
      err = access.tuple_variant(std::tuple_size_v<Payload>, visitor);
    } else if constexpr (NewtypeCase<C>) {
      err = access.newtype_variant(c.value);
    } else {
      err = access.unit_variant();
    }
    if (err) {
      return err;
    }
    out_.template emplace<I>(std::move(c));
    return {};
  }

  variant_type& out_;
};

}  // namespace detail

// ---- 标量 ----

template <>
struct Serde<bool> {
  static core::Error serialize(bool v, const Encoder& enc, Value& out) { return enc.encode_bool(v, out); }

  static core::Error deserialize(Decoder& dec, bool& out) {
    detail::BoolVisitor visitor(out);
    return dec.decode_any(visitor);
  }
};

template <class T>
  requires detail::is_integer_v<T>
struct Serde<T> {
  static core::Error serialize(T v, const Encoder& enc, Value& out) {
    if constexpr (std::is_signed_v<T>) {
      return enc.encode_i64(static_cast<std::int64_t>(v), out);
    } else {
      return enc.encode_u64(static_cast<std::uint64_t>(v), out);
    }
  }

  static core::Error deserialize(Decoder& dec, T& out) {
    detail::IntegerVisitor<T> visitor(out);
    return dec.decode_any(visitor);
  }
};

template <std::floating_point T>
struct Serde<T> {
  static core::Error serialize(T v, const Encoder& enc, Value& out) {
    return enc.encode_f64(static_cast<double>(v), out);
  }

  static core::Error deserialize(Decoder& dec, T& out) {
    detail::FloatVisitor<T> visitor(out);
    return dec.decode_any(visitor);
  }
};

template <class T>
  requires detail::is_char_v<T>
struct Serde<T> {
  static core::Error serialize(T v, const Encoder& enc, Value& out) {
    return enc.encode_char(static_cast<char32_t>(static_cast<std::make_unsigned_t<T>>(v)), out);
  }

  static core::Error deserialize(Decoder& dec, T& out) {
    detail::CharVisitor<T> visitor(out);
    return dec.decode_any(visitor);
  }
};

// ---- 文本与字节 ----

template <>
struct Serde<std::string> {
  static core::Error serialize(const std::string& v, const Encoder& enc, Value& out) {
    return enc.encode_string(v, out);
  }

  static core::Error deserialize(Decoder& dec, std::string& out) {
    detail::StringVisitor visitor(out);
    return dec.decode_any(visitor);
  }
};

// 只编码：不拥有存储的文本视图无法作为解码目标。
template <>
struct Serde<std::string_view> {
  static core::Error serialize(std::string_view v, const Encoder& enc, Value& out) {
    return enc.encode_string(v, out);
  }
};

template <>
struct Serde<const char*> {
  static core::Error serialize(const char* v, const Encoder& enc, Value& out) {
    if (!v) {
      return enc.encode_none(out);
    }
    return enc.encode_string(v, out);
  }
};

template <std::size_t N>
struct Serde<char[N]> {
  static core::Error serialize(const char (&v)[N], const Encoder& enc, Value& out) {
    return enc.encode_string(std::string_view(v, N > 0 && v[N - 1] == '\0' ? N - 1 : N), out);
  }
};

template <>
struct Serde<Blob> {
  class Visitor final : public serde::Visitor {
   public:
    explicit Visitor(Blob& out) noexcept : out_(out) {}

    [[nodiscard]] std::string expecting() const override { return "type blob"; }

    core::Error visit_bytes(std::vector<byte> v) override {
      out_.value = std::move(v);
      return {};
    }

    core::Error visit_unit() override {
      out_.value.clear();
      return {};
    }

    // 也接受元素都在 0..255 范围内的 Integer 数组。
    core::Error visit_seq(SeqAccess& seq) override {
      std::vector<byte> bytes;
      bytes.reserve(seq.remaining());
      for (;;) {
        std::optional<std::uint8_t> item;
        if (auto err = seq.next_element(item)) {
          return err;
        }
        if (!item) {
          break;
        }
        bytes.push_back(*item);
      }
      out_.value = std::move(bytes);
      return {};
    }

   private:
    Blob& out_;
  };

  static core::Error serialize(const Blob& v, const Encoder& enc, Value& out) {
    return enc.encode_bytes(v.value, out);
  }

  static core::Error deserialize(Decoder& dec, Blob& out) {
    Visitor visitor(out);
    return dec.decode_any(visitor);
  }
};

// ---- 动态目标 ----

template <>
struct Serde<Value> {
  static core::Error serialize(const Value& v, const Encoder&, Value& out) {
    out = v;
    return {};
  }

  static core::Error deserialize(Decoder& dec, Value& out) {
    ValueVisitor visitor(out);
    return dec.decode_any(visitor);
  }
};

// ---- unit ----

template <class T>
  requires(is_unit_struct<T>::value && std::default_initializable<T>)
struct Serde<T> {
  static core::Error serialize(const T&, const Encoder& enc, Value& out) { return enc.encode_unit(out); }

  static core::Error deserialize(Decoder& dec, T&) {
    detail::UnitVisitor visitor;
    return dec.decode_any(visitor);
  }
};

// ---- 可选值 ----

template <class T>
struct Serde<std::optional<T>> {
  static core::Error serialize(const std::optional<T>& v, const Encoder& enc, Value& out) {
    if (!v) {
      return enc.encode_none(out);
    }
    return enc.encode_some(*v, out);
  }

  static core::Error deserialize(Decoder& dec, std::optional<T>& out) {
    detail::OptionVisitor<T> visitor(out);
    return dec.decode_option(visitor);
  }
};

template <class T>
struct Serde<std::unique_ptr<T>> {
  static core::Error serialize(const std::unique_ptr<T>& v, const Encoder& enc, Value& out) {
    if (!v) {
      return enc.encode_none(out);
    }
    return enc.encode_some(*v, out);
  }

  static core::Error deserialize(Decoder& dec, std::unique_ptr<T>& out) {
    std::optional<T> inner;
    detail::OptionVisitor<T> visitor(inner);
    if (auto err = dec.decode_option(visitor)) {
      return err;
    }
    out = inner ? std::make_unique<T>(std::move(*inner)) : nullptr;
    return {};
  }
};

// ---- 序列 ----

template <class C>
struct SeqSerde {
  static core::Error serialize(const C& v, const Encoder& enc, Value& out) {
    auto seq = enc.encode_seq(v.size());
    for (const typename C::value_type& elem : v) {
      if (auto err = seq.element(elem)) {
        return err;
      }
    }
    return seq.end(out);
  }

  static core::Error deserialize(Decoder& dec, C& out) {
    detail::SeqVisitor<C> visitor(out);
    return dec.decode_any(visitor);
  }
};

template <class T, class A>
struct Serde<std::vector<T, A>> : SeqSerde<std::vector<T, A>> {};

template <class T, class A>
struct Serde<std::deque<T, A>> : SeqSerde<std::deque<T, A>> {};

template <class T, class A>
struct Serde<std::list<T, A>> : SeqSerde<std::list<T, A>> {};

template <class T, class Cmp, class A>
struct Serde<std::set<T, Cmp, A>> : SeqSerde<std::set<T, Cmp, A>> {};

template <class T, class H, class Eq, class A>
struct Serde<std::unordered_set<T, H, Eq, A>> : SeqSerde<std::unordered_set<T, H, Eq, A>> {};

// ---- 定长序列 ----

template <class Tup>
struct TupleSerde {
  static core::Error serialize(const Tup& v, const Encoder& enc, Value& out) {
    auto seq = enc.encode_seq(std::tuple_size_v<Tup>);
    core::Error err;
    std::apply([&](const auto&... elems) { (void)(... && !(err = seq.element(elems))); }, v);
    if (err) {
      return err;
    }
    return seq.end(out);
  }

  static core::Error deserialize(Decoder& dec, Tup& out) {
    detail::TupleLikeVisitor<Tup> visitor(out);
    return dec.decode_any(visitor);
  }
};

template <class T, std::size_t N>
struct Serde<std::array<T, N>> : TupleSerde<std::array<T, N>> {};

template <class A, class B>
struct Serde<std::pair<A, B>> : TupleSerde<std::pair<A, B>> {};

template <class... Ts>
struct Serde<std::tuple<Ts...>> : TupleSerde<std::tuple<Ts...>> {};

// ---- 映射 ----

template <class M>
struct MapSerde {
  static core::Error serialize(const M& v, const Encoder& enc, Value& out) {
    auto map = enc.encode_map(v.size());
    for (const auto& [key, value] : v) {
      if (auto err = map.entry(key, value)) {
        return err;
      }
    }
    return map.end(out);
  }

  static core::Error deserialize(Decoder& dec, M& out) {
    detail::MapVisitor<M> visitor(out);
    return dec.decode_any(visitor);
  }
};

template <class K, class V, class Cmp, class A>
struct Serde<std::map<K, V, Cmp, A>> : MapSerde<std::map<K, V, Cmp, A>> {};

template <class K, class V, class H, class Eq, class A>
struct Serde<std::unordered_map<K, V, H, Eq, A>> : MapSerde<std::unordered_map<K, V, H, Eq, A>> {};

// ---- 带标签联合 ----

template <NamedEnum E>
struct Serde<E> {
  static core::Error serialize(E v, const Encoder& enc, Value& out) {
    for (const auto& [value, name] : EnumNames<E>::entries) {
      if (value == v) {
        return enc.encode_unit_variant(name, out);
      }
    }
    return core::Error::unknown(std::to_string(static_cast<long long>(static_cast<std::underlying_type_t<E>>(v))));
  }

  static core::Error deserialize(Decoder& dec, E& out) {
    detail::EnumVisitor<E> visitor(out);
    return dec.decode_enum(visitor);
  }
};

/**
 * @brief 分支类型的 std::variant：每个分支类型提供 `static constexpr std::string_view tag`。
 *
 * 分支形状由分支类型决定：
 * - 提供 describe() -> 具名负载 {tag: Object}；
 * - 成员 value 为 std::tuple -> 位置负载 {tag: Array}；
 * - 其它成员 value -> 单负载 {tag: 负载}；
 * - 没有负载 -> 裸 String(tag)。
 */
template <class... Cs>
  requires(detail::TaggedCase<Cs> && ...)
struct Serde<std::variant<Cs...>> {
  static core::Error serialize(const std::variant<Cs...>& v, const Encoder& enc, Value& out) {
    if (v.valueless_by_exception()) {
      return core::Error::custom("valueless variant");
    }
    return std::visit([&](const auto& c) { return detail::encode_case(c, enc, out); }, v);
  }

  static core::Error deserialize(Decoder& dec, std::variant<Cs...>& out) {
    detail::VariantVisitor<Cs...> visitor(out);
    return dec.decode_enum(visitor);
  }
};

}  // namespace binjson::serde
