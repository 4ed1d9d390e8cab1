#include "binjson/serde/encoder.hpp"

#include "core/log_internal.hpp"

#include <string>
#include <utility>

namespace binjson::serde {
namespace {

constexpr char32_t kMaxCodePoint = 0x10FFFF;

[[nodiscard]] bool is_surrogate(char32_t c) noexcept { return c >= 0xD800 && c <= 0xDFFF; }

void append_utf8(std::string& out, char32_t c) {
  if (c < 0x80) {
    out.push_back(static_cast<char>(c));
  } else if (c < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (c >> 6)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else if (c < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (c >> 12)));
    out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (c >> 18)));
    out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  }
}

}  // namespace

core::Error Encoder::encode_bool(bool v, Value& out) const {
  out = Value(v);
  return {};
}

core::Error Encoder::encode_i64(std::int64_t v, Value& out) const {
  out = Value(v);
  return {};
}

core::Error Encoder::encode_u64(std::uint64_t v, Value& out) const {
  // 超过 int64 上限的值按位模式重解释（解码侧对称地还原）。
  out = Value(static_cast<std::int64_t>(v));
  return {};
}

core::Error Encoder::encode_f64(double v, Value& out) const {
  out = Value(v);
  return {};
}

core::Error Encoder::encode_char(char32_t c, Value& out) const {
  if (c > kMaxCodePoint || is_surrogate(c)) {
    core::detail::logger()->debug("encode_char: invalid code point U+{:X}", static_cast<std::uint32_t>(c));
    return core::Error::custom("invalid unicode scalar value");
  }
  std::string text;
  append_utf8(text, c);
  out = Value(std::move(text));
  return {};
}

core::Error Encoder::encode_string(std::string_view v, Value& out) const {
  out = Value(std::string(v));
  return {};
}

core::Error Encoder::encode_bytes(bytes_view v, Value& out) const {
  out = Value::blob(std::vector<byte>(v.begin(), v.end()));
  return {};
}

core::Error Encoder::encode_none(Value& out) const {
  out = Value::null();
  return {};
}

core::Error Encoder::encode_unit(Value& out) const {
  out = Value(Array{});
  return {};
}

core::Error Encoder::encode_unit_variant(std::string_view variant, Value& out) const {
  out = Value(std::string(variant));
  return {};
}

SeqEncoder Encoder::encode_seq(std::size_t len_hint) const { return SeqEncoder(nested(), len_hint); }

MapEncoder Encoder::encode_map(std::size_t len_hint) const { return MapEncoder(nested(), len_hint); }

StructEncoder Encoder::encode_struct(std::size_t len) const { return StructEncoder(nested(), len); }

TupleVariantEncoder Encoder::encode_tuple_variant(std::string_view variant, std::size_t len) const {
  // 负载位于 {tag: [...]} 之内，元素实际比当前值深两层。
  return TupleVariantEncoder(nested().nested(), variant, len);
}

StructVariantEncoder Encoder::encode_struct_variant(std::string_view variant, std::size_t len) const {
  return StructVariantEncoder(nested().nested(), variant, len);
}

core::Error Encoder::depth_error() const {
  core::detail::logger()->debug("encode: nesting depth {} exceeds limit {}", depth_, options_.max_depth);
  return core::Error::depth_exceeded(options_.max_depth);
}

SeqEncoder::SeqEncoder(Encoder child, std::size_t len_hint) : child_(child) { items_.reserve(len_hint); }

core::Error SeqEncoder::end(Value& out) {
  out = Value(std::move(items_));
  items_.clear();
  return {};
}

TupleVariantEncoder::TupleVariantEncoder(Encoder child, std::string_view variant, std::size_t len)
  : child_(child), variant_(variant) {
  items_.reserve(len);
}

core::Error TupleVariantEncoder::end(Value& out) {
  Object wrapper;
  wrapper.insert_or_assign(std::move(variant_), Value(std::move(items_)));
  items_.clear();
  out = Value(std::move(wrapper));
  return {};
}

MapEncoder::MapEncoder(Encoder child, std::size_t len_hint) : child_(child) { entries_.reserve(len_hint); }

core::Error MapEncoder::accept_key(Value key) {
  if (const auto* text = key.as_string()) {
    pending_key_ = *text;
    return {};
  }
  core::detail::logger()->debug("encode_map: key encoded as {}", key.error_description());
  return core::Error::expected("type str", key.error_description());
}

core::Error MapEncoder::end(Value& out) {
  out = Value(std::move(entries_));
  entries_ = Object{};
  pending_key_.reset();
  return {};
}

StructEncoder::StructEncoder(Encoder child, std::size_t len) : child_(child) { fields_.reserve(len); }

core::Error StructEncoder::end(Value& out) {
  out = Value(std::move(fields_));
  fields_ = Object{};
  return {};
}

StructVariantEncoder::StructVariantEncoder(Encoder child, std::string_view variant, std::size_t len)
  : child_(child), variant_(variant) {
  fields_.reserve(len);
}

core::Error StructVariantEncoder::end(Value& out) {
  Object wrapper;
  wrapper.insert_or_assign(std::move(variant_), Value(std::move(fields_)));
  fields_ = Object{};
  out = Value(std::move(wrapper));
  return {};
}

}  // namespace binjson::serde
