#include "binjson/value/value.hpp"

#include <bit>
#include <string>
#include <type_traits>
#include <utility>

namespace binjson {
namespace {

// 浮点比较采用“按位相等”而不是“容差比较”：
// - 往返关注的是位模式是否一致
// - 这样可以正确处理 NaN、-0/+0 等边界情况（按值比较可能产生歧义）
bool double_bits_equal(double a, double b) noexcept {
  return std::bit_cast<std::uint64_t>(a) == std::bit_cast<std::uint64_t>(b);
}

}  // namespace

Object::Object(std::initializer_list<value_type> entries) {
  reserve(entries.size());
  for (const auto& entry : entries) {
    insert_or_assign(entry.first, entry.second);
  }
}

#if BINJSON_PRESERVE_ORDER

const Value* Object::find(std::string_view key) const noexcept {
  const auto it = index_.find(key);
  return it == index_.end() ? nullptr : &entries_[it->second].second;
}

bool Object::insert_or_assign(std::string key, Value value) {
  const auto [it, inserted] = index_.try_emplace(key, entries_.size());
  if (!inserted) {
    entries_[it->second].second = std::move(value);
    return false;
  }
  entries_.emplace_back(std::move(key), std::move(value));
  return true;
}

bool Object::erase(std::string_view key) {
  const auto it = index_.find(key);
  if (it == index_.end()) {
    return false;
  }
  const auto pos = it->second;
  index_.erase(it);
  entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));
  // 被删条目之后的下标整体前移一位。
  for (std::size_t i = pos; i < entries_.size(); ++i) {
    index_.find(entries_[i].first)->second = i;
  }
  return true;
}

Object::container_type Object::release() {
  container_type out = std::move(entries_);
  entries_.clear();
  index_.clear();
  return out;
}

#else

const Value* Object::find(std::string_view key) const noexcept {
  const auto it = entries_.find(key);
  return it == entries_.end() ? nullptr : &it->second;
}

bool Object::insert_or_assign(std::string key, Value value) {
  return entries_.insert_or_assign(std::move(key), std::move(value)).second;
}

bool Object::erase(std::string_view key) {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return false;
  }
  entries_.erase(it);
  return true;
}

Object::container_type Object::release() {
  container_type out;
  out.reserve(entries_.size());
  while (!entries_.empty()) {
    auto node = entries_.extract(entries_.begin());
    out.emplace_back(std::move(node.key()), std::move(node.mapped()));
  }
  return out;
}

#endif

Value* Object::find(std::string_view key) noexcept {
  return const_cast<Value*>(std::as_const(*this).find(key));
}

bool operator==(const Object& lhs, const Object& rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (const auto& [key, value] : lhs) {
    const auto* other = rhs.find(key);
    if (!other || !(value == *other)) {
      return false;
    }
  }
  return true;
}

const char* kind_description(ValueKind kind) noexcept {
  switch (kind) {
    case ValueKind::null:
      return "type null";
    case ValueKind::boolean:
      return "type boolean";
    case ValueKind::blob:
      return "type blob";
    case ValueKind::array:
      return "type array";
    case ValueKind::integer:
      return "type integer";
    case ValueKind::floating:
      return "type float";
    case ValueKind::object:
      return "type object";
    case ValueKind::string:
      return "type string";
  }
  return "type unknown";
}

const char* Value::error_description() const noexcept {
  return kind_description(kind());
}

bool operator==(const Value& lhs, const Value& rhs) noexcept {
  if (lhs.storage_.index() != rhs.storage_.index()) {
    return false;
  }
  return std::visit(
    [&](const auto& a) -> bool {
      using T = std::decay_t<decltype(a)>;
      const auto* b = std::get_if<T>(&rhs.storage_);
      if (!b) {
        return false;
      }
      if constexpr (std::is_same_v<T, double>) {
        return double_bits_equal(a, *b);
      } else {
        return a == *b;
      }
    },
    lhs.storage_);
}

}  // namespace binjson
