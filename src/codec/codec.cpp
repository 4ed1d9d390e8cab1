#include "binjson/codec/codec.hpp"

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

namespace binjson::codec {
namespace {

class binjson_codec_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "binjson.codec"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::truncated:
        return "truncated input";
      case errc::invalid_tag:
        return "invalid value tag";
      case errc::invalid_bool:
        return "invalid boolean byte";
      case errc::invalid_utf8:
        return "string is not valid utf-8";
      case errc::invalid_integer:
        return "invalid variable-length integer";
      case errc::length_overflow:
        return "length overflow";
      case errc::depth_exceeded:
        return "nesting depth exceeded";
      case errc::buffer_overflow:
        return "output buffer overflow";
      default:
        return "unknown binjson.codec error";
    }
  }
};

// 变长整数标记字节：小于 251 的值直接占 1 字节。
constexpr byte kU16Marker = 251;
constexpr byte kU32Marker = 252;
constexpr byte kU64Marker = 253;

constexpr std::size_t kFloatBytes = 8;

constexpr bool checked_add(std::size_t a, std::size_t b, std::size_t& out) noexcept {
  if (b > (std::numeric_limits<std::size_t>::max() - a)) {
    return false;
  }
  out = a + b;
  return true;
}

constexpr std::size_t varint_size(std::uint64_t v) noexcept {
  if (v < kU16Marker) {
    return 1;
  }
  if (v <= 0xFFFFu) {
    return 3;
  }
  if (v <= 0xFFFF'FFFFu) {
    return 5;
  }
  return 9;
}

constexpr std::uint64_t zigzag_encode(std::int64_t v) noexcept {
  return (static_cast<std::uint64_t>(v) << 1) ^ static_cast<std::uint64_t>(v >> 63);
}

constexpr std::int64_t zigzag_decode(std::uint64_t v) noexcept {
  return static_cast<std::int64_t>(v >> 1) ^ -static_cast<std::int64_t>(v & 1u);
}

// 按 UTF-8 规范校验（拒绝过长编码、代理区与超过 U+10FFFF 的码点）。
bool is_valid_utf8(bytes_view s) noexcept {
  std::size_t i = 0;
  while (i < s.size()) {
    const auto c = s[i];
    if (c < 0x80u) {
      ++i;
      continue;
    }
    std::size_t extra = 0;
    std::uint32_t cp = 0;
    std::uint32_t min_cp = 0;
    if ((c & 0xE0u) == 0xC0u) {
      extra = 1;
      cp = c & 0x1Fu;
      min_cp = 0x80u;
    } else if ((c & 0xF0u) == 0xE0u) {
      extra = 2;
      cp = c & 0x0Fu;
      min_cp = 0x800u;
    } else if ((c & 0xF8u) == 0xF0u) {
      extra = 3;
      cp = c & 0x07u;
      min_cp = 0x10000u;
    } else {
      return false;
    }
    if (s.size() - i <= extra) {
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto cc = s[i + k];
      if ((cc & 0xC0u) != 0x80u) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3Fu);
    }
    if (cp < min_cp || cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

class SpanWriter final {
 public:
  explicit SpanWriter(mutable_bytes_view out) : out_(out) {}

  [[nodiscard]] std::size_t written() const noexcept { return written_; }

  std::error_code write_u8(byte v) noexcept {
    if (written_ >= out_.size()) {
      return make_error_code(errc::buffer_overflow);
    }
    out_[written_++] = v;
    return {};
  }

  std::error_code write_bytes(bytes_view v) noexcept {
    if (v.empty()) {
      return {};
    }
    if (out_.size() - written_ < v.size()) {
      return make_error_code(errc::buffer_overflow);
    }
    std::copy(v.begin(), v.end(), out_.begin() + static_cast<std::ptrdiff_t>(written_));
    written_ += v.size();
    return {};
  }

  template <class UInt>
  std::error_code write_le_uint(UInt v) noexcept {
    static_assert(std::is_unsigned_v<UInt>);
    if (out_.size() - written_ < sizeof(UInt)) {
      return make_error_code(errc::buffer_overflow);
    }
    for (std::size_t i = 0; i < sizeof(UInt); ++i) {
      out_[written_ + i] = static_cast<byte>((v >> (8u * i)) & 0xFFu);
    }
    written_ += sizeof(UInt);
    return {};
  }

  std::error_code write_varint(std::uint64_t v) noexcept {
    if (v < kU16Marker) {
      return write_u8(static_cast<byte>(v));
    }
    if (v <= 0xFFFFu) {
      auto ec = write_u8(kU16Marker);
      return ec ? ec : write_le_uint<std::uint16_t>(static_cast<std::uint16_t>(v));
    }
    if (v <= 0xFFFF'FFFFu) {
      auto ec = write_u8(kU32Marker);
      return ec ? ec : write_le_uint<std::uint32_t>(static_cast<std::uint32_t>(v));
    }
    auto ec = write_u8(kU64Marker);
    return ec ? ec : write_le_uint<std::uint64_t>(v);
  }

 private:
  mutable_bytes_view out_{};
  std::size_t written_{0};
};

class SpanReader final {
 public:
  explicit SpanReader(bytes_view in) : in_(in) {}

  [[nodiscard]] std::size_t remaining() const noexcept { return in_.size() - pos_; }
  [[nodiscard]] std::size_t consumed() const noexcept { return pos_; }

  std::error_code read_u8(byte& out) noexcept {
    if (pos_ >= in_.size()) {
      return make_error_code(errc::truncated);
    }
    out = in_[pos_++];
    return {};
  }

  template <class UInt>
  std::error_code read_le_uint(UInt& out) noexcept {
    static_assert(std::is_unsigned_v<UInt>);
    if (remaining() < sizeof(UInt)) {
      return make_error_code(errc::truncated);
    }
    UInt v = 0;
    for (std::size_t i = 0; i < sizeof(UInt); ++i) {
      v = static_cast<UInt>(v | (static_cast<UInt>(in_[pos_ + i]) << (8u * i)));
    }
    pos_ += sizeof(UInt);
    out = v;
    return {};
  }

  // max_width：目标整数宽度（字节）。超宽的标记字节视为非法整数。
  std::error_code read_varint(std::uint64_t& out, std::size_t max_width) noexcept {
    byte marker = 0;
    auto ec = read_u8(marker);
    if (ec) {
      return ec;
    }
    if (marker < kU16Marker) {
      out = marker;
      return {};
    }
    if (marker == kU16Marker) {
      std::uint16_t v = 0;
      ec = read_le_uint(v);
      out = v;
      return ec;
    }
    if (marker == kU32Marker && max_width >= 4) {
      std::uint32_t v = 0;
      ec = read_le_uint(v);
      out = v;
      return ec;
    }
    if (marker == kU64Marker && max_width >= 8) {
      std::uint64_t v = 0;
      ec = read_le_uint(v);
      out = v;
      return ec;
    }
    return make_error_code(errc::invalid_integer);
  }

  std::error_code read_payload(std::size_t n, bytes_view& out) noexcept {
    if (remaining() < n) {
      return make_error_code(errc::truncated);
    }
    out = in_.subspan(pos_, n);
    pos_ += n;
    return {};
  }

 private:
  bytes_view in_{};
  std::size_t pos_{0};
};

std::error_code encoded_size_impl(const Value& value, std::size_t& out_size) noexcept;
std::error_code encode_value(const Value& value, SpanWriter& w) noexcept;
std::error_code decode_value(SpanReader& r, Value& out, std::size_t depth, const DecodeLimits& limits) noexcept;

std::error_code add_size(std::size_t& total, std::size_t n) noexcept {
  std::size_t next = 0;
  if (!checked_add(total, n, next)) {
    return make_error_code(errc::length_overflow);
  }
  total = next;
  return {};
}

std::error_code encoded_size_impl(const Value& value, std::size_t& out_size) noexcept {
  std::size_t total = varint_size(static_cast<std::uint64_t>(value.kind()));

  const auto ec = std::visit(
    [&](const auto& v) -> std::error_code {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, Null>) {
        return {};
      } else if constexpr (std::is_same_v<T, bool>) {
        return add_size(total, 1);
      } else if constexpr (std::is_same_v<T, Blob>) {
        auto e = add_size(total, varint_size(v.value.size()));
        return e ? e : add_size(total, v.value.size());
      } else if constexpr (std::is_same_v<T, std::string>) {
        auto e = add_size(total, varint_size(v.size()));
        return e ? e : add_size(total, v.size());
      } else if constexpr (std::is_same_v<T, std::int64_t>) {
        return add_size(total, varint_size(zigzag_encode(v)));
      } else if constexpr (std::is_same_v<T, double>) {
        return add_size(total, kFloatBytes);
      } else if constexpr (std::is_same_v<T, Array>) {
        auto e = add_size(total, varint_size(v.size()));
        if (e) {
          return e;
        }
        for (const auto& child : v) {
          std::size_t child_size = 0;
          e = encoded_size_impl(child, child_size);
          if (e) {
            return e;
          }
          e = add_size(total, child_size);
          if (e) {
            return e;
          }
        }
        return {};
      } else if constexpr (std::is_same_v<T, Object>) {
        auto e = add_size(total, varint_size(v.size()));
        if (e) {
          return e;
        }
        for (const auto& [key, child] : v) {
          e = add_size(total, varint_size(key.size()));
          if (!e) {
            e = add_size(total, key.size());
          }
          if (e) {
            return e;
          }
          std::size_t child_size = 0;
          e = encoded_size_impl(child, child_size);
          if (e) {
            return e;
          }
          e = add_size(total, child_size);
          if (e) {
            return e;
          }
        }
        return {};
      } else {
        return make_error_code(errc::invalid_tag);
      }
    },
    value.storage());
  if (ec) {
    return ec;
  }
  out_size = total;
  return {};
}

std::error_code write_text(SpanWriter& w, const std::string& s) noexcept {
  auto ec = w.write_varint(s.size());
  if (ec) {
    return ec;
  }
  return w.write_bytes(bytes_view{reinterpret_cast<const byte*>(s.data()), s.size()});
}

std::error_code encode_value(const Value& value, SpanWriter& w) noexcept {
  auto ec = w.write_varint(static_cast<std::uint64_t>(value.kind()));
  if (ec) {
    return ec;
  }
  return std::visit(
    [&](const auto& v) -> std::error_code {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, Null>) {
        return {};
      } else if constexpr (std::is_same_v<T, bool>) {
        return w.write_u8(static_cast<byte>(v ? 0x01 : 0x00));
      } else if constexpr (std::is_same_v<T, Blob>) {
        auto e = w.write_varint(v.value.size());
        return e ? e : w.write_bytes(bytes_view{v.value.data(), v.value.size()});
      } else if constexpr (std::is_same_v<T, std::string>) {
        return write_text(w, v);
      } else if constexpr (std::is_same_v<T, std::int64_t>) {
        return w.write_varint(zigzag_encode(v));
      } else if constexpr (std::is_same_v<T, double>) {
        return w.write_le_uint<std::uint64_t>(std::bit_cast<std::uint64_t>(v));
      } else if constexpr (std::is_same_v<T, Array>) {
        auto e = w.write_varint(v.size());
        if (e) {
          return e;
        }
        for (const auto& child : v) {
          e = encode_value(child, w);
          if (e) {
            return e;
          }
        }
        return {};
      } else if constexpr (std::is_same_v<T, Object>) {
        auto e = w.write_varint(v.size());
        if (e) {
          return e;
        }
        for (const auto& [key, child] : v) {
          e = write_text(w, key);
          if (e) {
            return e;
          }
          e = encode_value(child, w);
          if (e) {
            return e;
          }
        }
        return {};
      } else {
        return make_error_code(errc::invalid_tag);
      }
    },
    value.storage());
}

std::error_code read_length(SpanReader& r, const DecodeLimits& limits, std::size_t& out) noexcept {
  std::uint64_t n = 0;
  auto ec = r.read_varint(n, 8);
  if (ec) {
    return ec;
  }
  if (n > limits.max_container_length || n > std::numeric_limits<std::size_t>::max()) {
    return make_error_code(errc::length_overflow);
  }
  out = static_cast<std::size_t>(n);
  return {};
}

std::error_code read_text(SpanReader& r, const DecodeLimits& limits, std::string& out) noexcept {
  std::size_t n = 0;
  auto ec = read_length(r, limits, n);
  if (ec) {
    return ec;
  }
  bytes_view payload{};
  ec = r.read_payload(n, payload);
  if (ec) {
    return ec;
  }
  if (!is_valid_utf8(payload)) {
    return make_error_code(errc::invalid_utf8);
  }
  out.assign(reinterpret_cast<const char*>(payload.data()), payload.size());
  return {};
}

std::error_code decode_value(SpanReader& r, Value& out, std::size_t depth, const DecodeLimits& limits) noexcept {
  if (depth > limits.max_depth) {
    return make_error_code(errc::depth_exceeded);
  }

  // 判别值按 u32 解码（与 bincode 的 enum variant index 一致）。
  std::uint64_t tag = 0;
  auto ec = r.read_varint(tag, 4);
  if (ec) {
    return ec;
  }
  if (tag > static_cast<std::uint64_t>(ValueKind::string)) {
    return make_error_code(errc::invalid_tag);
  }

  switch (static_cast<ValueKind>(tag)) {
    case ValueKind::null: {
      out = Value(Null{});
      return {};
    }
    case ValueKind::boolean: {
      byte b = 0;
      ec = r.read_u8(b);
      if (ec) {
        return ec;
      }
      if (b > 1) {
        return make_error_code(errc::invalid_bool);
      }
      out = Value(b == 1);
      return {};
    }
    case ValueKind::blob: {
      std::size_t n = 0;
      ec = read_length(r, limits, n);
      if (ec) {
        return ec;
      }
      bytes_view payload{};
      ec = r.read_payload(n, payload);
      if (ec) {
        return ec;
      }
      out = Value(Blob{std::vector<byte>(payload.begin(), payload.end())});
      return {};
    }
    case ValueKind::array: {
      std::size_t n = 0;
      ec = read_length(r, limits, n);
      if (ec) {
        return ec;
      }
      // 每个元素至少 1 字节：预分配不超过剩余输入，避免伪造长度触发巨量分配。
      Array items;
      items.reserve(std::min(n, r.remaining()));
      for (std::size_t i = 0; i < n; ++i) {
        Value child;
        ec = decode_value(r, child, depth + 1, limits);
        if (ec) {
          return ec;
        }
        items.push_back(std::move(child));
      }
      out = Value(std::move(items));
      return {};
    }
    case ValueKind::integer: {
      std::uint64_t bits = 0;
      ec = r.read_varint(bits, 8);
      if (ec) {
        return ec;
      }
      out = Value(zigzag_decode(bits));
      return {};
    }
    case ValueKind::floating: {
      std::uint64_t bits = 0;
      ec = r.read_le_uint(bits);
      if (ec) {
        return ec;
      }
      out = Value(std::bit_cast<double>(bits));
      return {};
    }
    case ValueKind::object: {
      std::size_t n = 0;
      ec = read_length(r, limits, n);
      if (ec) {
        return ec;
      }
      Object obj;
      obj.reserve(std::min(n, r.remaining()));
      for (std::size_t i = 0; i < n; ++i) {
        std::string key;
        ec = read_text(r, limits, key);
        if (ec) {
          return ec;
        }
        Value child;
        ec = decode_value(r, child, depth + 1, limits);
        if (ec) {
          return ec;
        }
        // 重复键：后者覆盖前者。
        obj.insert_or_assign(std::move(key), std::move(child));
      }
      out = Value(std::move(obj));
      return {};
    }
    case ValueKind::string: {
      std::string s;
      ec = read_text(r, limits, s);
      if (ec) {
        return ec;
      }
      out = Value(std::move(s));
      return {};
    }
  }
  return make_error_code(errc::invalid_tag);
}

}  // namespace

const std::error_category& error_category() noexcept {
  static binjson_codec_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

std::error_code encoded_size(const Value& value, std::size_t& out_size) noexcept {
  return encoded_size_impl(value, out_size);
}

std::error_code encode(const Value& value, std::vector<byte>& out) noexcept {
  std::size_t size = 0;
  auto ec = encoded_size(value, size);
  if (ec) {
    return ec;
  }

  const auto offset = out.size();
  if (size > (std::numeric_limits<std::size_t>::max() - offset)) {
    return make_error_code(errc::length_overflow);
  }

  out.resize(offset + size);
  mutable_bytes_view dest{out.data() + offset, size};

  std::size_t written = 0;
  ec = encode_to(dest, value, written);
  if (ec) {
    out.resize(offset);
    return ec;
  }
  if (written != size) {
    out.resize(offset);
    return make_error_code(errc::length_overflow);
  }
  return {};
}

std::error_code encode_to(mutable_bytes_view out, const Value& value, std::size_t& written) noexcept {
  SpanWriter w(out);
  auto ec = encode_value(value, w);
  written = w.written();
  return ec;
}

std::error_code decode_one(bytes_view in, Value& out, std::size_t& consumed, const DecodeLimits& limits) noexcept {
  SpanReader r(in);
  Value decoded;
  auto ec = decode_value(r, decoded, 0, limits);
  if (ec) {
    consumed = 0;
    return ec;
  }
  out = std::move(decoded);
  consumed = r.consumed();
  return {};
}

}  // namespace binjson::codec
