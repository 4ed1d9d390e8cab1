#include "binjson/binjson.hpp"

#include "core/log_internal.hpp"

namespace binjson {

Error encode_value(const Value& value, std::vector<byte>& out) {
  if (auto ec = codec::encode(value, out)) {
    core::detail::logger()->debug("encode_value failed: {}", ec.message());
    return Error::binary_codec(ec);
  }
  return {};
}

Error decode_value(bytes_view in, Value& out, std::size_t& consumed, const codec::DecodeLimits& limits) {
  if (auto ec = codec::decode_one(in, out, consumed, limits)) {
    core::detail::logger()->debug("decode_value failed after {} input bytes: {}", in.size(), ec.message());
    return Error::binary_codec(ec);
  }
  return {};
}

}  // namespace binjson
