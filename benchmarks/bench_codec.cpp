#include "bench_main.hpp"
#include "binjson/codec/codec.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace binjson;
using namespace binjson::codec;

static Value create_deep_nested_array(int depth) {
  if (depth <= 0) {
    return Value(42);
  }
  return Value(Array{create_deep_nested_array(depth - 1)});
}

static void decode_or_report(const std::vector<byte>& encoded) {
  Value decoded;
  std::size_t consumed = 0;
  auto ec = decode_one(bytes_view{encoded.data(), encoded.size()}, decoded, consumed);
  if (ec) {
    std::cerr << "Decode failed: " << ec.message() << "\n";
  }
}

static void bench_codec_deep_nested() {
  // 解码深度上限以内的最深嵌套
  constexpr int depth = 127;

  Value value = create_deep_nested_array(depth);
  std::vector<byte> encoded;

  BENCH_RUN("codec: deep nested array encode (127 levels)", depth, 3, {
    encoded.clear();
    auto ec = encode(value, encoded);
    if (ec) {
      std::cerr << "Encode failed: " << ec.message() << "\n";
    }
  });

  BENCH_RUN("codec: deep nested array decode (127 levels)", encoded.size(), 3, decode_or_report(encoded));
}

static void bench_codec_large_array() {
  constexpr std::size_t item_count = 10000;

  Array items;
  items.reserve(item_count);
  for (std::size_t i = 0; i < item_count; ++i) {
    items.push_back(Value(static_cast<std::int64_t>(i) * 1000 - 5'000'000));
  }
  Value value(std::move(items));
  std::vector<byte> encoded;

  BENCH_RUN("codec: integer array encode (10000 items)", item_count * sizeof(std::int64_t), 5, {
    encoded.clear();
    auto ec = encode(value, encoded);
    if (ec) {
      std::cerr << "Encode failed: " << ec.message() << "\n";
    }
  });

  BENCH_RUN("codec: integer array decode (10000 items)", encoded.size(), 5, decode_or_report(encoded));
}

static void bench_codec_large_object() {
  constexpr std::size_t entry_count = 2000;

  Object entries;
  for (std::size_t i = 0; i < entry_count; ++i) {
    entries.insert_or_assign("key_" + std::to_string(i), Value(static_cast<double>(i) * 0.5));
  }
  Value value(std::move(entries));
  std::vector<byte> encoded;

  BENCH_RUN("codec: object encode (2000 entries)", entry_count, 5, {
    encoded.clear();
    auto ec = encode(value, encoded);
    if (ec) {
      std::cerr << "Encode failed: " << ec.message() << "\n";
    }
  });

  BENCH_RUN("codec: object decode (2000 entries)", encoded.size(), 5, decode_or_report(encoded));
}

static void bench_codec_reverse_ordered_keys() {
  // 键按降序到达：每次插入都落在已有键之前
  constexpr std::size_t entry_count = 100000;

  std::vector<byte> encoded{0x06, 0xFC};
  for (int shift = 0; shift < 32; shift += 8) {
    encoded.push_back(static_cast<byte>((entry_count >> shift) & 0xFF));
  }
  for (std::size_t i = entry_count; i-- > 0;) {
    auto digits = std::to_string(i);
    const auto key = "k" + std::string(6 - digits.size(), '0') + digits;
    encoded.push_back(static_cast<byte>(key.size()));
    encoded.insert(encoded.end(), key.begin(), key.end());
    encoded.push_back(0x00);
  }

  BENCH_RUN("codec: reverse-ordered object decode (100000 entries)", encoded.size(), 3, decode_or_report(encoded));
}

static void bench_codec_large_payloads() {
  constexpr std::size_t size = 1024 * 1024;

  Value text(std::string(size, 'A'));
  std::vector<byte> blob_bytes(size);
  for (std::size_t i = 0; i < size; ++i) {
    blob_bytes[i] = static_cast<byte>(i & 0xFF);
  }
  Value blob = Value::blob(std::move(blob_bytes));

  std::vector<byte> text_encoded;
  BENCH_RUN("codec: string encode (1 MB)", size, 5, {
    text_encoded.clear();
    auto ec = encode(text, text_encoded);
    if (ec) {
      std::cerr << "Encode failed: " << ec.message() << "\n";
    }
  });
  // 包含 UTF-8 校验
  BENCH_RUN("codec: string decode (1 MB)", size, 5, decode_or_report(text_encoded));

  std::vector<byte> blob_encoded;
  BENCH_RUN("codec: blob encode (1 MB)", size, 5, {
    blob_encoded.clear();
    auto ec = encode(blob, blob_encoded);
    if (ec) {
      std::cerr << "Encode failed: " << ec.message() << "\n";
    }
  });
  BENCH_RUN("codec: blob decode (1 MB)", size, 5, decode_or_report(blob_encoded));
}

int main() {
  bench_codec_deep_nested();
  bench_codec_large_array();
  bench_codec_large_object();
  bench_codec_reverse_ordered_keys();
  bench_codec_large_payloads();

  binjson::benchmarks::print_results();
  return 0;
}
