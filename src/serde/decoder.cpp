#include "binjson/serde/decoder.hpp"

#include "core/log_internal.hpp"

#include <string>
#include <utility>

namespace binjson::serde {

// ---- Visitor ----

core::Error Visitor::invalid_type(std::string_view found) const {
  return core::Error::expected(expecting(), std::string(found));
}

core::Error Visitor::visit_none() { return invalid_type(kind_description(ValueKind::null)); }

core::Error Visitor::visit_some(Decoder& dec) {
  const auto* value = dec.peek();
  return invalid_type(value ? value->error_description() : kind_description(ValueKind::null));
}

core::Error Visitor::visit_unit() { return invalid_type(kind_description(ValueKind::array)); }

core::Error Visitor::visit_bool(bool) { return invalid_type(kind_description(ValueKind::boolean)); }

core::Error Visitor::visit_i64(std::int64_t) { return invalid_type(kind_description(ValueKind::integer)); }

core::Error Visitor::visit_f64(double) { return invalid_type(kind_description(ValueKind::floating)); }

core::Error Visitor::visit_string(std::string) { return invalid_type(kind_description(ValueKind::string)); }

core::Error Visitor::visit_bytes(std::vector<byte>) { return invalid_type(kind_description(ValueKind::blob)); }

core::Error Visitor::visit_seq(SeqAccess&) { return invalid_type(kind_description(ValueKind::array)); }

core::Error Visitor::visit_map(MapAccess&) { return invalid_type(kind_description(ValueKind::object)); }

core::Error Visitor::visit_enum(EnumAccess& access) { return invalid_type(access.source_description()); }

// ---- Decoder ----

core::Error Decoder::check_depth() const {
  if (depth_ > options_.max_depth) {
    core::detail::logger()->debug("decode: nesting depth {} exceeds limit {}", depth_, options_.max_depth);
    return core::Error::depth_exceeded(options_.max_depth);
  }
  return {};
}

std::optional<Value> Decoder::take() noexcept {
  std::optional<Value> out = std::move(value_);
  value_.reset();
  return out;
}

core::Error Decoder::decode_any(Visitor& visitor) {
  if (auto err = check_depth()) {
    return err;
  }
  auto value = take();
  if (!value) {
    return core::Error::eof();
  }

  auto& storage = value->storage();
  switch (value->kind()) {
    case ValueKind::null:
      return visitor.visit_none();
    case ValueKind::boolean:
      return visitor.visit_bool(std::get<bool>(storage));
    case ValueKind::blob:
      return visitor.visit_bytes(std::move(std::get<Blob>(storage).value));
    case ValueKind::array: {
      SeqAccess seq(std::move(std::get<Array>(storage)), options_, depth_ + 1);
      return visitor.visit_seq(seq);
    }
    case ValueKind::integer:
      return visitor.visit_i64(std::get<std::int64_t>(storage));
    case ValueKind::floating:
      return visitor.visit_f64(std::get<double>(storage));
    case ValueKind::object: {
      MapAccess map(std::get<Object>(storage).release(), options_, depth_ + 1);
      return visitor.visit_map(map);
    }
    case ValueKind::string:
      return visitor.visit_string(std::move(std::get<std::string>(storage)));
  }
  return core::Error::eof();
}

core::Error Decoder::decode_option(Visitor& visitor) {
  if (auto err = check_depth()) {
    return err;
  }
  if (!value_) {
    return core::Error::eof();
  }
  if (value_->is_null()) {
    value_.reset();
    return visitor.visit_none();
  }
  return visitor.visit_some(*this);
}

core::Error Decoder::decode_enum(Visitor& visitor) {
  if (auto err = check_depth()) {
    return err;
  }
  auto value = take();
  if (!value) {
    return core::Error::eof();
  }

  if (value->is_string()) {
    EnumAccess access(std::move(std::get<std::string>(value->storage())), std::nullopt, ValueKind::string,
                      options_, depth_ + 1);
    return visitor.visit_enum(access);
  }
  if (!value->is_object()) {
    return core::Error::expected("an enum", value->error_description());
  }

  auto entries = std::get<Object>(value->storage()).release();
  if (entries.empty()) {
    return core::Error::expected("variant name", "empty object");
  }
  if (entries.size() > 1) {
    return core::Error::expected("map with a single key", "extra key \"" + entries[1].first + "\"");
  }
  EnumAccess access(std::move(entries[0].first), std::move(entries[0].second), ValueKind::object, options_,
                    depth_ + 1);
  return visitor.visit_enum(access);
}

// ---- SeqAccess / MapAccess ----

std::optional<Decoder> SeqAccess::next_decoder() {
  if (next_ >= items_.size()) {
    return std::nullopt;
  }
  return Decoder(std::move(items_[next_++]), options_, depth_);
}

std::optional<Decoder> MapAccess::next_key_decoder() {
  if (next_ >= entries_.size()) {
    return std::nullopt;
  }
  auto& entry = entries_[next_++];
  pending_value_ = std::move(entry.second);
  return Decoder(Value(std::move(entry.first)), options_, depth_);
}

Decoder MapAccess::next_value_decoder() {
  if (!pending_value_) {
    return Decoder::empty(options_, depth_);
  }
  Decoder dec(std::move(*pending_value_), options_, depth_);
  pending_value_.reset();
  return dec;
}

// ---- EnumAccess ----

std::optional<Value> EnumAccess::take_payload() noexcept {
  std::optional<Value> out = std::move(payload_);
  payload_.reset();
  return out;
}

core::Error EnumAccess::unit_variant() {
  auto payload = take_payload();
  if (!payload) {
    return {};
  }
  Value discarded;
  ValueVisitor visitor(discarded);
  return Decoder(std::move(*payload), options_, depth_).decode_any(visitor);
}

core::Error EnumAccess::tuple_variant(std::size_t, Visitor& visitor) {
  auto payload = take_payload();
  if (!payload) {
    return core::Error::eof();
  }
  if (depth_ > options_.max_depth) {
    return core::Error::depth_exceeded(options_.max_depth);
  }
  auto* items = std::get_if<Array>(&payload->storage());
  if (!items) {
    return core::Error::expected("a tuple", payload->error_description());
  }
  if (items->empty()) {
    return visitor.visit_unit();
  }
  SeqAccess seq(std::move(*items), options_, depth_ + 1);
  return visitor.visit_seq(seq);
}

core::Error EnumAccess::struct_variant(Visitor& visitor) {
  auto payload = take_payload();
  if (!payload) {
    return core::Error::eof();
  }
  if (depth_ > options_.max_depth) {
    return core::Error::depth_exceeded(options_.max_depth);
  }
  auto* fields = std::get_if<Object>(&payload->storage());
  if (!fields) {
    return core::Error::expected("a struct", payload->error_description());
  }
  MapAccess map(fields->release(), options_, depth_ + 1);
  return visitor.visit_map(map);
}

// ---- ValueVisitor ----

core::Error ValueVisitor::visit_none() {
  out_ = Value::null();
  return {};
}

core::Error ValueVisitor::visit_some(Decoder& dec) { return dec.decode_any(*this); }

core::Error ValueVisitor::visit_unit() {
  out_ = Value(Array{});
  return {};
}

core::Error ValueVisitor::visit_bool(bool v) {
  out_ = Value(v);
  return {};
}

core::Error ValueVisitor::visit_i64(std::int64_t v) {
  out_ = Value(v);
  return {};
}

core::Error ValueVisitor::visit_f64(double v) {
  out_ = Value(v);
  return {};
}

core::Error ValueVisitor::visit_string(std::string v) {
  out_ = Value(std::move(v));
  return {};
}

core::Error ValueVisitor::visit_bytes(std::vector<byte> v) {
  out_ = Value::blob(std::move(v));
  return {};
}

core::Error ValueVisitor::visit_seq(SeqAccess& seq) {
  Array items;
  items.reserve(seq.remaining());
  while (auto dec = seq.next_decoder()) {
    Value item;
    ValueVisitor child(item);
    if (auto err = dec->decode_any(child)) {
      return err;
    }
    items.push_back(std::move(item));
  }
  out_ = Value(std::move(items));
  return {};
}

core::Error ValueVisitor::visit_map(MapAccess& map) {
  Object entries;
  entries.reserve(map.remaining());
  while (auto key_dec = map.next_key_decoder()) {
    // 键总是 String Value。
    std::string key;
    if (const auto* text = key_dec->peek() ? key_dec->peek()->as_string() : nullptr) {
      key = *text;
    }
    Value item;
    ValueVisitor child(item);
    auto value_dec = map.next_value_decoder();
    if (auto err = value_dec.decode_any(child)) {
      return err;
    }
    entries.insert_or_assign(std::move(key), std::move(item));
  }
  out_ = Value(std::move(entries));
  return {};
}

// ---- detail ----

namespace detail {

bool decode_single_utf8(std::string_view text, char32_t& out) noexcept {
  if (text.empty()) {
    return false;
  }
  const auto lead = static_cast<std::uint8_t>(text[0]);
  std::size_t len = 0;
  char32_t cp = 0;
  if (lead < 0x80) {
    len = 1;
    cp = lead;
  } else if ((lead & 0xE0) == 0xC0) {
    len = 2;
    cp = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    len = 3;
    cp = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    len = 4;
    cp = lead & 0x07;
  } else {
    return false;
  }
  if (text.size() != len) {
    return false;
  }
  for (std::size_t i = 1; i < len; ++i) {
    const auto cont = static_cast<std::uint8_t>(text[i]);
    if ((cont & 0xC0) != 0x80) {
      return false;
    }
    cp = (cp << 6) | (cont & 0x3F);
  }
  // 拒绝过长编码、代理区与超出 Unicode 范围的码点。
  static constexpr char32_t kMinForLength[5] = {0, 0, 0x80, 0x800, 0x10000};
  if (cp < kMinForLength[len] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
    return false;
  }
  out = cp;
  return true;
}

}  // namespace detail

}  // namespace binjson::serde
