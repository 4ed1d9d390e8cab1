#pragma once

#include "binjson/serde/decoder.hpp"
#include "binjson/serde/encoder.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace binjson::serde {

/**
 * @brief 具名字段引用：describe() 返回的元组元素。
 */
template <class M>
struct FieldRef final {
  std::string_view name;
  M* ptr;
};

template <class M>
[[nodiscard]] constexpr FieldRef<M> field(std::string_view name, M& member) noexcept {
  return FieldRef<M>{name, &member};
}

template <class... Ms>
[[nodiscard]] constexpr std::tuple<FieldRef<Ms>...> fields(FieldRef<Ms>... refs) noexcept {
  return std::tuple<FieldRef<Ms>...>(refs...);
}

/**
 * @brief 具名字段结构：提供
 *   template <class Self> static auto describe(Self& self) { return fields(field("x", self.x), ...); }
 * 的类型（Self 为 T 或 const T）。
 *
 * 编码为按字段名为键的 Object；解码只接受 Object：
 * - 未声明的字段 -> Unknown(name)（类型声明 `static constexpr bool ignore_unknown_fields = true` 时跳过）；
 * - 重复字段 -> Duplicated(name)；
 * - 缺失的必需字段 -> Missing(name)；std::optional/std::unique_ptr 成员缺失时置空。
 */
template <class T>
concept Described = requires(T& t, const T& ct) {
  T::describe(t);
  T::describe(ct);
};

namespace detail {

template <class T>
struct is_optional_member : std::false_type {};
template <class T>
struct is_optional_member<std::optional<T>> : std::true_type {};
template <class T, class D>
struct is_optional_member<std::unique_ptr<T, D>> : std::true_type {};

template <class T>
[[nodiscard]] constexpr bool ignores_unknown_fields() noexcept {
  if constexpr (requires { T::ignore_unknown_fields; }) {
    return T::ignore_unknown_fields;
  } else {
    return false;
  }
}

template <class T>
using field_tuple_t = decltype(T::describe(std::declval<T&>()));

template <class T>
inline constexpr std::size_t field_count_v = std::tuple_size_v<field_tuple_t<T>>;

// 依次把每个字段交给 builder.field(name, value)；遇到第一个错误即停止。
template <class Builder, class Tuple>
core::Error encode_fields(Builder& builder, const Tuple& refs) {
  core::Error err;
  std::apply([&](const auto&... f) { (void)(... && !(err = builder.field(f.name, *f.ptr))); }, refs);
  return err;
}

template <class Tuple, std::size_t... I>
std::size_t field_index(const Tuple& refs, std::string_view name, std::index_sequence<I...>) noexcept {
  std::size_t index = sizeof...(I);
  (void)(... || (std::get<I>(refs).name == name ? (index = I, true) : false));
  return index;
}

template <class Tuple, std::size_t... I>
core::Error decode_field_at(MapAccess& map, const Tuple& refs, std::size_t index, std::index_sequence<I...>) {
  core::Error err;
  (void)(... || (I == index ? (err = map.next_value(*std::get<I>(refs).ptr), true) : false));
  return err;
}

template <class Tuple, std::size_t N, std::size_t... I>
core::Error finish_fields(const Tuple& refs, const std::array<bool, N>& seen, std::index_sequence<I...>) {
  core::Error err;
  auto check = [&](auto& ref, bool present) -> bool {
    if (present) {
      return true;
    }
    using M = std::remove_cvref_t<decltype(*ref.ptr)>;
    if constexpr (is_optional_member<M>::value) {
      ref.ptr->reset();
      return true;
    } else {
      err = core::Error::missing(std::string(ref.name));
      return false;
    }
  };
  (void)(... && check(std::get<I>(refs), seen[I]));
  return err;
}

/**
 * @brief 具名字段结构的构建回调：直接写入 out 的成员。
 */
template <Described T>
class StructVisitor final : public Visitor {
 public:
  explicit StructVisitor(T& out) noexcept : out_(out) {}

  [[nodiscard]] std::string expecting() const override { return "a struct"; }

  core::Error visit_map(MapAccess& map) override {
    constexpr std::size_t kCount = field_count_v<T>;
    constexpr auto kIndices = std::make_index_sequence<kCount>{};
    auto refs = T::describe(out_);
    std::array<bool, kCount> seen{};

    while (auto key_dec = map.next_key_decoder()) {
      // MapAccess 总是以 String Value 提供键。
      const auto* key_value = key_dec->peek();
      const auto* key = key_value ? key_value->as_string() : nullptr;
      if (!key) {
        return core::Error::expected("field name", key_value ? key_value->error_description() : "type null");
      }
      const auto index = field_index(refs, *key, kIndices);
      if (index == kCount) {
        if constexpr (ignores_unknown_fields<T>()) {
          Value skipped;
          ValueVisitor skip(skipped);
          auto value_dec = map.next_value_decoder();
          if (auto err = value_dec.decode_any(skip)) {
            return err;
          }
          continue;
        } else {
          return core::Error::unknown(*key);
        }
      }
      if (seen[index]) {
        return core::Error::duplicated(*key);
      }
      seen[index] = true;
      if (auto err = decode_field_at(map, refs, index, kIndices)) {
        return err;
      }
    }
    return finish_fields(refs, seen, kIndices);
  }

 private:
  T& out_;
};

}  // namespace detail

template <Described T>
struct Serde<T> {
  static core::Error serialize(const T& v, const Encoder& enc, Value& out) {
    const auto refs = T::describe(v);
    auto builder = enc.encode_struct(std::tuple_size_v<std::remove_const_t<decltype(refs)>>);
    if (auto err = detail::encode_fields(builder, refs)) {
      return err;
    }
    return builder.end(out);
  }

  static core::Error deserialize(Decoder& dec, T& out) {
    detail::StructVisitor<T> visitor(out);
    return dec.decode_any(visitor);
  }
};

}  // namespace binjson::serde
