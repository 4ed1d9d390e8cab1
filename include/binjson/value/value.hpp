#pragma once

#include "binjson/core/common.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace binjson {

using byte = core::byte;
using bytes_view = core::bytes_view;

class Value;
using Array = std::vector<Value>;

struct Null final {
  friend bool operator==(const Null&, const Null&) = default;
};

struct Blob final {
  std::vector<byte> value;
  friend bool operator==(const Blob&, const Blob&) = default;
};

/**
 * @brief 字符串键 -> Value 的映射（键唯一）。
 *
 * 约定：
 * - 遍历顺序由 core::kKeyOrder 决定（sorted：按键升序；insertion：按插入顺序）；
 * - sorted 以 std::map 存储；insertion 以向量存储并维护键 -> 下标索引，
 *   查找与插入均不随条目数线性增长；
 * - 对已存在的键 insert_or_assign 会原位替换值，不改变其位置；
 * - 通过迭代器只允许修改值，不允许修改键；
 * - 相等比较与顺序无关。
 */
class Object final {
 public:
  using value_type = std::pair<std::string, Value>;
  using container_type = std::vector<value_type>;
#if BINJSON_PRESERVE_ORDER
  using storage_type = container_type;
#else
  using storage_type = std::map<std::string, Value, std::less<>>;
#endif
  using iterator = storage_type::iterator;
  using const_iterator = storage_type::const_iterator;

  Object() = default;
  Object(std::initializer_list<value_type> entries);

  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;

  [[nodiscard]] iterator begin() noexcept;
  [[nodiscard]] iterator end() noexcept;
  [[nodiscard]] const_iterator begin() const noexcept;
  [[nodiscard]] const_iterator end() const noexcept;

  [[nodiscard]] const Value* find(std::string_view key) const noexcept;
  [[nodiscard]] Value* find(std::string_view key) noexcept;
  [[nodiscard]] bool contains(std::string_view key) const noexcept;

  // 返回 true 表示插入了新键；false 表示替换了已有键的值。
  bool insert_or_assign(std::string key, Value value);
  bool erase(std::string_view key);

  void reserve(std::size_t n);

  // 移出全部条目（按遍历顺序），Object 变为空。
  [[nodiscard]] container_type release();

  friend bool operator==(const Object& lhs, const Object& rhs) noexcept;

 private:
  storage_type entries_;
#if BINJSON_PRESERVE_ORDER
  struct KeyHash {
    using is_transparent = void;
    std::size_t operator()(std::string_view key) const noexcept { return std::hash<std::string_view>{}(key); }
  };

  // 键 -> entries_ 下标。
  std::unordered_map<std::string, std::size_t, KeyHash, std::equal_to<>> index_;
#endif
};

/**
 * @brief Value 的变体标签，顺序即二进制编码中的判别值（Null = 0 ... String = 7）。
 */
enum class ValueKind : std::uint8_t {
  null = 0,
  boolean = 1,
  blob = 2,
  array = 3,
  integer = 4,
  floating = 5,
  object = 6,
  string = 7,
};

/**
 * @brief 自描述的动态值树。
 *
 * 约定：
 * - 所有整数统一为 int64（无符号数按位模式重解释）；浮点统一为 double；
 * - 子节点独占所有权：嵌入父节点时移动而不是共享；
 * - 浮点比较采用“按位相等”，保证 NaN、-0/+0 在往返后可区分。
 */
class Value final {
  template <class T>
  static constexpr bool is_character = std::same_as<T, char> || std::same_as<T, wchar_t> || std::same_as<T, char8_t> ||
                                       std::same_as<T, char16_t> || std::same_as<T, char32_t>;

 public:
  using storage_type = std::variant<Null, bool, Blob, Array, std::int64_t, double, Object, std::string>;

  Value() noexcept = default;

  Value(Null v) noexcept : storage_(v) {}
  Value(bool v) noexcept : storage_(v) {}
  Value(Blob v) : storage_(std::move(v)) {}
  Value(Array v) : storage_(std::move(v)) {}
  Value(std::int64_t v) noexcept : storage_(v) {}
  template <std::integral I>
    requires(!std::same_as<I, bool> && !std::same_as<I, std::int64_t> && !is_character<I>)
  Value(I v) noexcept : storage_(static_cast<std::int64_t>(v)) {}
  // 字符不是整数：单个字符应经 Encoder 映射为 String。
  template <class C>
    requires is_character<C>
  Value(C) = delete;
  Value(double v) noexcept : storage_(v) {}
  Value(Object v) : storage_(std::move(v)) {}
  Value(std::string v) : storage_(std::move(v)) {}
  Value(const char* v) : storage_(std::string(v)) {}

  static Value null() noexcept { return Value(Null{}); }
  static Value boolean(bool v) noexcept { return Value(v); }
  static Value blob(std::vector<byte> v) { return Value(Blob{std::move(v)}); }
  static Value array(std::vector<Value> v) { return Value(Array(std::move(v))); }
  static Value integer(std::int64_t v) noexcept { return Value(v); }
  static Value floating(double v) noexcept { return Value(v); }
  static Value object(Object v) { return Value(std::move(v)); }
  static Value string(std::string v) { return Value(std::move(v)); }

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }
  [[nodiscard]] storage_type& storage() noexcept { return storage_; }

  [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(storage_.index()); }

  [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<Null>(storage_); }
  [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(storage_); }
  [[nodiscard]] bool is_blob() const noexcept { return std::holds_alternative<Blob>(storage_); }
  [[nodiscard]] bool is_array() const noexcept { return std::holds_alternative<Array>(storage_); }
  [[nodiscard]] bool is_integer() const noexcept { return std::holds_alternative<std::int64_t>(storage_); }
  [[nodiscard]] bool is_float() const noexcept { return std::holds_alternative<double>(storage_); }
  [[nodiscard]] bool is_object() const noexcept { return std::holds_alternative<Object>(storage_); }
  [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(storage_); }

  // 变体不匹配时返回 nullptr（不抛异常）。
  [[nodiscard]] const bool* as_bool() const noexcept { return std::get_if<bool>(&storage_); }
  [[nodiscard]] const Blob* as_blob() const noexcept { return std::get_if<Blob>(&storage_); }
  [[nodiscard]] const Array* as_array() const noexcept { return std::get_if<Array>(&storage_); }
  [[nodiscard]] const std::int64_t* as_integer() const noexcept { return std::get_if<std::int64_t>(&storage_); }
  [[nodiscard]] const double* as_float() const noexcept { return std::get_if<double>(&storage_); }
  [[nodiscard]] const Object* as_object() const noexcept { return std::get_if<Object>(&storage_); }
  [[nodiscard]] const std::string* as_string() const noexcept { return std::get_if<std::string>(&storage_); }

  /**
   * @brief 变体的固定可读标签（"type null" / "type integer" ...）。
   *
   * 仅用于拼装错误消息，不参与控制流。
   */
  [[nodiscard]] const char* error_description() const noexcept;

  friend bool operator==(const Value& lhs, const Value& rhs) noexcept;
  friend bool operator!=(const Value& lhs, const Value& rhs) noexcept { return !(lhs == rhs); }

 private:
  storage_type storage_{Null{}};
};

[[nodiscard]] const char* kind_description(ValueKind kind) noexcept;

inline std::size_t Object::size() const noexcept { return entries_.size(); }
inline bool Object::empty() const noexcept { return entries_.empty(); }
inline Object::iterator Object::begin() noexcept { return entries_.begin(); }
inline Object::iterator Object::end() noexcept { return entries_.end(); }
inline Object::const_iterator Object::begin() const noexcept { return entries_.begin(); }
inline Object::const_iterator Object::end() const noexcept { return entries_.end(); }
inline bool Object::contains(std::string_view key) const noexcept { return find(key) != nullptr; }
inline void Object::reserve([[maybe_unused]] std::size_t n) {
#if BINJSON_PRESERVE_ORDER
  entries_.reserve(n);
  index_.reserve(n);
#endif
}

}  // namespace binjson
