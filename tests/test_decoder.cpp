#include "binjson/serde/decoder.hpp"
#include "binjson/serde/traits.hpp"

#include "test_main.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

namespace {

using binjson::serde::field;
using binjson::serde::fields;

enum class Level : std::uint8_t { low = 0, high = 1 };

struct Marker {};

struct Point {
  std::int32_t x{0};
  std::int32_t y{0};

  template <class Self>
  static auto describe(Self& self) {
    return fields(field("x", self.x), field("y", self.y));
  }

  friend bool operator==(const Point&, const Point&) = default;
};

struct Profile {
  std::string name;
  std::optional<std::uint32_t> age;
  std::vector<std::string> tags;

  template <class Self>
  static auto describe(Self& self) {
    return fields(field("name", self.name), field("age", self.age), field("tags", self.tags));
  }
};

struct LenientPoint {
  static constexpr bool ignore_unknown_fields = true;

  std::int32_t x{0};

  template <class Self>
  static auto describe(Self& self) {
    return fields(field("x", self.x));
  }
};

struct Quit {
  static constexpr std::string_view tag = "Quit";
};

struct Move {
  static constexpr std::string_view tag = "Move";
  std::int32_t x{0};
  std::int32_t y{0};

  template <class Self>
  static auto describe(Self& self) {
    return fields(field("x", self.x), field("y", self.y));
  }
};

struct Write {
  static constexpr std::string_view tag = "Write";
  std::string value;
};

struct ChangeColor {
  static constexpr std::string_view tag = "ChangeColor";
  std::tuple<std::int32_t, std::int32_t, std::int32_t> value;
};

struct Reset {
  static constexpr std::string_view tag = "Reset";
  std::tuple<> value;
};

using Message = std::variant<Quit, Move, Write, ChangeColor, Reset>;

}  // namespace

namespace binjson::serde {

template <>
struct EnumNames<Level> {
  static constexpr std::array<std::pair<Level, std::string_view>, 2> entries{{
    {Level::low, "Low"},
    {Level::high, "High"},
  }};
};

template <>
struct is_unit_struct<Marker> : std::true_type {};

}  // namespace binjson::serde

namespace {

using binjson::Array;
using binjson::Blob;
using binjson::Object;
using binjson::Value;
using binjson::core::errc;
using binjson::core::Error;
using binjson::serde::Decoder;
using binjson::serde::MapAccess;
using binjson::serde::Options;
using binjson::serde::SeqAccess;
using binjson::serde::Visitor;

template <class T>
T decode_ok(Value v) {
  Decoder dec(std::move(v));
  T out{};
  TEST_EXPECT_OK(dec.decode(out));
  return out;
}

template <class T>
Error decode_err(Value v, const Options& options = {}) {
  Decoder dec(std::move(v), options);
  T out{};
  return dec.decode(out);
}

// 记录 decode_any 分派到的回调。
class RecordingVisitor final : public Visitor {
 public:
  std::string last;
  std::size_t length{0};

  [[nodiscard]] std::string expecting() const override { return "anything"; }

  Error visit_none() override { return record("none"); }
  Error visit_bool(bool) override { return record("bool"); }
  Error visit_i64(std::int64_t) override { return record("i64"); }
  Error visit_f64(double) override { return record("f64"); }
  Error visit_string(std::string) override { return record("string"); }
  Error visit_bytes(std::vector<binjson::byte> v) override {
    length = v.size();
    return record("bytes");
  }
  Error visit_seq(SeqAccess& seq) override {
    length = seq.remaining();
    return record("seq");
  }
  Error visit_map(MapAccess& map) override {
    length = map.remaining();
    return record("map");
  }

 private:
  Error record(const char* what) {
    last = what;
    return {};
  }
};

// 不覆盖任何 visit_*：所有输入都以 Expected 失败。
class RejectingVisitor final : public Visitor {
 public:
  [[nodiscard]] std::string expecting() const override { return "nothing"; }
};

void test_decode_any_dispatch() {
  const std::pair<Value, std::string_view> cases[] = {
    {Value::null(), "none"},
    {Value(true), "bool"},
    {Value::blob({1, 2, 3}), "bytes"},
    {Value(Array{Value(1), Value(2)}), "seq"},
    {Value(7), "i64"},
    {Value(1.5), "f64"},
    {Value(Object{{"k", Value(1)}}), "map"},
    {Value("s"), "string"},
  };
  for (const auto& [value, expected] : cases) {
    RecordingVisitor visitor;
    Decoder dec(value);
    TEST_EXPECT_OK(dec.decode_any(visitor));
    TEST_EXPECT_EQ(visitor.last, std::string(expected));
  }

  RecordingVisitor visitor;
  Decoder seq_dec(Value(Array{Value(1), Value(2)}));
  TEST_EXPECT_OK(seq_dec.decode_any(visitor));
  TEST_EXPECT_EQ(visitor.length, std::size_t{2});
}

void test_visitor_defaults_report_found_label() {
  RejectingVisitor visitor;
  Decoder dec(Value(Object{}));
  TEST_EXPECT_EQ(dec.decode_any(visitor), Error::expected("nothing", "type object"));

  Decoder dec_blob(Value::blob({}));
  TEST_EXPECT_EQ(dec_blob.decode_any(visitor), Error::expected("nothing", "type blob"));

  Decoder dec_null(Value::null());
  TEST_EXPECT_EQ(dec_null.decode_any(visitor), Error::expected("nothing", "type null"));
}

void test_eof() {
  RecordingVisitor visitor;
  auto empty = Decoder::empty();
  TEST_EXPECT_EQ(empty.decode_any(visitor), Error::eof());
  TEST_EXPECT_EQ(empty.decode_option(visitor), Error::eof());
  TEST_EXPECT_EQ(empty.decode_enum(visitor), Error::eof());

  // 同一个 Decoder 只能解码一次。
  Decoder dec(Value(1));
  TEST_EXPECT(dec.peek() != nullptr);
  TEST_EXPECT_OK(dec.decode_any(visitor));
  TEST_EXPECT(dec.peek() == nullptr);
  TEST_EXPECT_EQ(dec.decode_any(visitor), Error::eof());
}

void test_seq_and_map_access() {
  SeqAccess seq(Array{Value(1)}, Options{}, 1);
  std::optional<int> item;
  TEST_EXPECT_OK(seq.next_element(item));
  TEST_EXPECT(item.has_value());
  TEST_EXPECT_EQ(*item, 1);
  TEST_EXPECT_EQ(seq.remaining(), std::size_t{0});
  TEST_EXPECT_OK(seq.next_element(item));
  TEST_EXPECT(!item.has_value());

  MapAccess map(Object{{"k", Value(2)}}.release(), Options{}, 1);
  int value = 0;
  // 尚未取键时没有待解码的值。
  TEST_EXPECT_EQ(map.next_value(value), Error::eof());

  std::optional<std::string> key;
  TEST_EXPECT_OK(map.next_key(key));
  TEST_EXPECT(key.has_value());
  TEST_EXPECT_EQ(*key, "k");
  TEST_EXPECT_OK(map.next_value(value));
  TEST_EXPECT_EQ(value, 2);
  TEST_EXPECT_OK(map.next_key(key));
  TEST_EXPECT(!key.has_value());
}

void test_scalars_and_ranges() {
  TEST_EXPECT_EQ(decode_ok<bool>(Value(true)), true);
  TEST_EXPECT_EQ(decode_ok<std::int32_t>(Value(-7)), -7);
  TEST_EXPECT_EQ(decode_ok<std::uint64_t>(Value(-1)), std::numeric_limits<std::uint64_t>::max());
  TEST_EXPECT_EQ(decode_ok<double>(Value(2.5)), 2.5);
  TEST_EXPECT_EQ(decode_ok<double>(Value(3)), 3.0);
  TEST_EXPECT_EQ(decode_ok<float>(Value(0.5)), 0.5f);

  TEST_EXPECT_EQ(decode_err<std::uint8_t>(Value(300)), Error::expected("integer in range of u8", "integer 300"));
  TEST_EXPECT_EQ(decode_err<std::uint32_t>(Value(-1)), Error::expected("integer in range of u32", "integer -1"));
  TEST_EXPECT_EQ(decode_err<std::int16_t>(Value(40000)),
                 Error::expected("integer in range of i16", "integer 40000"));

  TEST_EXPECT_EQ(decode_err<int>(Value("5")), Error::expected("type integer", "type string"));
  TEST_EXPECT_EQ(decode_err<int>(Value(1.0)), Error::expected("type integer", "type float"));
  TEST_EXPECT_EQ(decode_err<bool>(Value(1)), Error::expected("type boolean", "type integer"));
  TEST_EXPECT_EQ(decode_err<std::string>(Value::blob({})), Error::expected("type string", "type blob"));
}

void test_characters() {
  TEST_EXPECT_EQ(decode_ok<char>(Value("a")), 'a');
  TEST_EXPECT(decode_ok<char32_t>(Value("\xC3\xA9")) == U'é');
  TEST_EXPECT(decode_ok<char32_t>(Value("\xF0\x9F\x98\x80")) == U'\U0001F600');

  TEST_EXPECT_EQ(decode_err<char>(Value("ab")), Error::expected("a single character", "string \"ab\""));
  TEST_EXPECT_EQ(decode_err<char>(Value("")), Error::expected("a single character", "string \"\""));
  TEST_EXPECT_EQ(decode_err<char16_t>(Value("\xF0\x9F\x98\x80")).kind(), errc::expected);
}

void test_blob_accepts_bytes_and_integer_arrays() {
  TEST_EXPECT(decode_ok<Blob>(Value::blob({9, 8})) == (Blob{{9, 8}}));
  TEST_EXPECT(decode_ok<Blob>(Value(Array{Value(0), Value(255)})) == (Blob{{0, 255}}));
  TEST_EXPECT_EQ(decode_err<Blob>(Value(Array{Value(256)})),
                 Error::expected("integer in range of u8", "integer 256"));
}

void test_optional_collapse() {
  TEST_EXPECT(!decode_ok<std::optional<int>>(Value::null()).has_value());
  const auto some = decode_ok<std::optional<int>>(Value(5));
  TEST_EXPECT(some.has_value());
  TEST_EXPECT_EQ(*some, 5);

  // 缺省值不能解码为非可选整数。
  TEST_EXPECT_EQ(decode_err<int>(Value::null()), Error::expected("type integer", "type null"));

  const auto boxed = decode_ok<std::unique_ptr<std::string>>(Value("b"));
  TEST_EXPECT(boxed != nullptr);
  TEST_EXPECT_EQ(*boxed, "b");
  TEST_EXPECT(decode_ok<std::unique_ptr<std::string>>(Value::null()) == nullptr);
}

void test_unit_and_empty_array_equivalence() {
  TEST_EXPECT_OK(decode_err<std::monostate>(Value(Array{})));
  TEST_EXPECT_OK(decode_err<Marker>(Value(Array{})));
  TEST_EXPECT_OK(decode_err<std::tuple<>>(Value(Array{})));

  TEST_EXPECT_EQ(decode_err<Marker>(Value(Array{Value(1)})),
                 Error::expected("an empty array", "array of length 1"));
  TEST_EXPECT_EQ(decode_err<Marker>(Value(1)), Error::expected("unit", "type integer"));

  // 空 Array 也是长度为 0 的序列。
  TEST_EXPECT(decode_ok<std::vector<int>>(Value(Array{})).empty());
}

void test_sequences_and_fixed_length() {
  TEST_EXPECT_EQ(decode_ok<std::vector<int>>(Value(Array{Value(1), Value(2)})), (std::vector<int>{1, 2}));
  TEST_EXPECT_EQ(decode_ok<std::set<std::string>>(Value(Array{Value("b"), Value("a")})),
                 (std::set<std::string>{"a", "b"}));
  TEST_EXPECT_EQ(decode_ok<std::vector<bool>>(Value(Array{Value(true)})), (std::vector<bool>{true}));

  TEST_EXPECT_EQ((decode_ok<std::array<int, 2>>(Value(Array{Value(1), Value(2)}))), (std::array<int, 2>{1, 2}));
  TEST_EXPECT_EQ((decode_ok<std::pair<int, std::string>>(Value(Array{Value(1), Value("x")}))),
                 (std::pair<int, std::string>{1, "x"}));
  TEST_EXPECT_EQ((decode_err<std::pair<int, int>>(Value(Array{Value(1), Value(2), Value(3)}))),
                 Error::expected("array of length 2", "array of length 3"));
  TEST_EXPECT_EQ((decode_err<std::tuple<int, int>>(Value(Object{}))),
                 Error::expected("array of length 2", "type object"));

  TEST_EXPECT_EQ(decode_err<std::vector<int>>(Value(Array{Value(1), Value("x")})),
                 Error::expected("type integer", "type string"));
  TEST_EXPECT_EQ(decode_err<std::vector<int>>(Value(Object{})), Error::expected("type array", "type object"));
}

void test_maps() {
  const auto m = decode_ok<std::map<std::string, int>>(Value(Object{{"a", Value(1)}, {"b", Value(2)}}));
  TEST_EXPECT_EQ(m, (std::map<std::string, int>{{"a", 1}, {"b", 2}}));
  TEST_EXPECT_EQ((decode_err<std::map<std::string, int>>(Value(Array{}))),
                 Error::expected("type object", "type array"));
  // 键以 String 形式交给键的形状描述。
  TEST_EXPECT_EQ((decode_err<std::map<int, int>>(Value(Object{{"1", Value(1)}}))),
                 Error::expected("type integer", "type string"));
}

void test_named_field_struct() {
  TEST_EXPECT(decode_ok<Point>(Value(Object{{"x", Value(1)}, {"y", Value(2)}})) == (Point{1, 2}));

  TEST_EXPECT_EQ(decode_err<Point>(Value(Object{{"x", Value(1)}})), Error::missing("y"));
  TEST_EXPECT_EQ(decode_err<Point>(Value(Object{{"x", Value(1)}, {"y", Value(2)}, {"z", Value(3)}})),
                 Error::unknown("z"));
  TEST_EXPECT_EQ(decode_err<Point>(Value(7)), Error::expected("a struct", "type integer"));
  TEST_EXPECT_EQ(decode_err<Point>(Value(Object{{"x", Value("1")}, {"y", Value(2)}})),
                 Error::expected("type integer", "type string"));

  const auto lenient = decode_ok<LenientPoint>(Value(Object{{"x", Value(4)}, {"extra", Value(Array{})}}));
  TEST_EXPECT_EQ(lenient.x, 4);
}

void test_optional_fields_default_to_absent() {
  const auto p = decode_ok<Profile>(Value(Object{{"name", Value("n")}, {"tags", Value(Array{})}}));
  TEST_EXPECT_EQ(p.name, "n");
  TEST_EXPECT(!p.age.has_value());

  const auto q = decode_ok<Profile>(
    Value(Object{{"name", Value("n")}, {"age", Value(30)}, {"tags", Value(Array{Value("t")})}}));
  TEST_EXPECT(q.age.has_value());
  TEST_EXPECT_EQ(*q.age, 30u);
  TEST_EXPECT_EQ(q.tags, (std::vector<std::string>{"t"}));

  TEST_EXPECT_EQ(decode_err<Profile>(Value(Object{{"name", Value("n")}})), Error::missing("tags"));
}

void test_tagged_union() {
  TEST_EXPECT(std::holds_alternative<Quit>(decode_ok<Message>(Value("Quit"))));

  const auto move = decode_ok<Message>(Value(Object{{"Move", Value(Object{{"x", Value(1)}, {"y", Value(2)}})}}));
  TEST_EXPECT(std::holds_alternative<Move>(move));
  TEST_EXPECT_EQ(std::get<Move>(move).x, 1);
  TEST_EXPECT_EQ(std::get<Move>(move).y, 2);

  const auto write = decode_ok<Message>(Value(Object{{"Write", Value("hi")}}));
  TEST_EXPECT(std::holds_alternative<Write>(write));
  TEST_EXPECT_EQ(std::get<Write>(write).value, "hi");

  const auto color = decode_ok<Message>(Value(Object{{"ChangeColor", Value(Array{Value(1), Value(2), Value(3)})}}));
  TEST_EXPECT(std::holds_alternative<ChangeColor>(color));
  TEST_EXPECT(std::get<ChangeColor>(color).value == std::make_tuple(1, 2, 3));

  // 空 Array 负载走 visit_unit。
  TEST_EXPECT(std::holds_alternative<Reset>(decode_ok<Message>(Value(Object{{"Reset", Value(Array{})}}))));
  TEST_EXPECT_EQ(decode_err<Message>(Value(Object{{"ChangeColor", Value(Array{})}})),
                 Error::expected("array of length 3", "array of length 0"));

  // unit 分支的负载被解码后丢弃。
  TEST_EXPECT(std::holds_alternative<Quit>(decode_ok<Message>(Value(Object{{"Quit", Value(Array{Value(1)})}}))));
}

void test_tagged_union_errors() {
  TEST_EXPECT_EQ(decode_err<Message>(Value(Object{})), Error::expected("variant name", "empty object"));
  TEST_EXPECT_EQ(decode_err<Message>(Value(Object{{"Move", Value(Object{})}, {"Write", Value("x")}})),
                 Error::expected("map with a single key", "extra key \"Write\""));
  TEST_EXPECT_EQ(decode_err<Message>(Value(5)), Error::expected("an enum", "type integer"));
  TEST_EXPECT_EQ(decode_err<Message>(Value("Jump")), Error::unknown("Jump"));
  TEST_EXPECT_EQ(decode_err<Message>(Value(Object{{"ChangeColor", Value(5)}})),
                 Error::expected("a tuple", "type integer"));
  TEST_EXPECT_EQ(decode_err<Message>(Value(Object{{"Move", Value(Array{Value(1)})}})),
                 Error::expected("a struct", "type array"));
  // 需要负载的分支以裸 String 出现。
  TEST_EXPECT_EQ(decode_err<Message>(Value("Write")), Error::eof());
  TEST_EXPECT_EQ(decode_err<Message>(Value("Move")), Error::eof());
}

void test_named_enum() {
  TEST_EXPECT(decode_ok<Level>(Value("High")) == Level::high);
  TEST_EXPECT(decode_ok<Level>(Value(Object{{"Low", Value::null()}})) == Level::low);
  TEST_EXPECT_EQ(decode_err<Level>(Value("Medium")), Error::unknown("Medium"));
  TEST_EXPECT_EQ(decode_err<Level>(Value(true)), Error::expected("an enum", "type boolean"));
}

void test_dynamic_value_target() {
  const Value tree(Object{{"a", Value(Array{Value::null(), Value(1.5), Value::blob({7})})}, {"b", Value("s")}});
  TEST_EXPECT(decode_ok<Value>(tree) == tree);
}

void test_depth_limit() {
  Options options;
  options.max_depth = 2;

  const Value two_levels(Array{Value(Array{Value(1)})});
  Decoder dec(two_levels, options);
  std::vector<std::vector<int>> out;
  TEST_EXPECT_OK(dec.decode(out));

  const Value three_levels(Array{Value(Array{Value(Array{Value(1)})})});
  TEST_EXPECT_EQ(decode_err<std::vector<std::vector<std::vector<int>>>>(three_levels, options),
                 Error::depth_exceeded(2));
  TEST_EXPECT_EQ(decode_err<Value>(three_levels, options).kind(), errc::depth_exceeded);
}

}  // namespace

int main() {
  test_decode_any_dispatch();
  test_visitor_defaults_report_found_label();
  test_eof();
  test_seq_and_map_access();
  test_scalars_and_ranges();
  test_characters();
  test_blob_accepts_bytes_and_integer_arrays();
  test_optional_collapse();
  test_unit_and_empty_array_equivalence();
  test_sequences_and_fixed_length();
  test_maps();
  test_named_field_struct();
  test_optional_fields_default_to_absent();
  test_tagged_union();
  test_tagged_union_errors();
  test_named_enum();
  test_dynamic_value_target();
  test_depth_limit();
  return ::binjson::tests::run_and_report();
}
