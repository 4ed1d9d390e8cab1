#include "test_main.hpp"

#include "binjson/utils/base64.hpp"
#include "binjson/utils/json.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace binjson;

namespace {

void test_to_json_text_compact() {
    const Value tree(Object{{"b", Value(1)},
                            {"a", Value(Array{Value(true), Value::null(), Value(0.5), Value("s")})}});
    std::string text;
    TEST_EXPECT_OK(utils::to_json_text(tree, text));
    TEST_EXPECT_EQ(text, std::string(R"({"a":[true,null,0.5,"s"],"b":1})"));
}

void test_blob_and_non_finite_floats_become_strings() {
    TEST_EXPECT(utils::to_json(Value::blob({'f', 'o', 'o'})) == utils::Json("Zm9v"));
    TEST_EXPECT(utils::to_json(Value(std::numeric_limits<double>::quiet_NaN())) == utils::Json("NaN"));
    TEST_EXPECT(utils::to_json(Value(std::numeric_limits<double>::infinity())) == utils::Json("inf"));
    TEST_EXPECT(utils::to_json(Value(-std::numeric_limits<double>::infinity())) == utils::Json("-inf"));

    // Blob 的文本形式可以由 decode_base64 还原。
    const std::vector<byte> payload{0x00, 0xFB, 0xFF, 0x10};
    const auto text = utils::to_json(Value::blob(payload));
    std::vector<byte> back;
    TEST_EXPECT_OK(utils::decode_base64(text.get<std::string>(), back));
    TEST_EXPECT_EQ(back, payload);
}

void test_from_json_text() {
    Value out;
    TEST_EXPECT_OK(utils::from_json_text(R"({"id": 7, "name": "a", "tags": [1.25, false, null]})", out));
    const Value expected(Object{{"id", Value(7)},
                                {"name", Value("a")},
                                {"tags", Value(Array{Value(1.25), Value(false), Value::null()})}});
    TEST_EXPECT(out == expected);

    // 超出 int64 的无符号数按位模式重解释。
    TEST_EXPECT_OK(utils::from_json_text("18446744073709551615", out));
    TEST_EXPECT(out == Value(std::int64_t{-1}));
}

void test_from_json_text_rejects_malformed_input() {
    Value out("keep");
    const auto err = utils::from_json_text("{\"a\": ", out);
    TEST_EXPECT_EQ(err.kind(), core::errc::custom);
    TEST_EXPECT(out == Value("keep"));
}

std::string nested_arrays(std::size_t levels) {
    return std::string(levels, '[') + std::string(levels, ']');
}

void test_from_json_text_bounds_nesting_depth() {
    Value out;
    TEST_EXPECT_OK(utils::from_json_text(nested_arrays(4), out, 3));
    TEST_EXPECT_EQ(utils::from_json_text(nested_arrays(5), out, 3), core::Error::depth_exceeded(3));

    Value keep("keep");
    const auto err = utils::from_json_text(nested_arrays(10000), keep);
    TEST_EXPECT_EQ(err.kind(), core::errc::depth_exceeded);
    TEST_EXPECT(keep == Value("keep"));

    utils::Json deep = utils::Json::array();
    for (int i = 0; i < 10; ++i) {
        deep = utils::Json::array({deep});
    }
    TEST_EXPECT_EQ(utils::from_json(deep, out, 5).kind(), core::errc::depth_exceeded);
    TEST_EXPECT_OK(utils::from_json(deep, out));
}

void test_to_json_text_rejects_invalid_utf8() {
    std::string text;
    const auto err = utils::to_json_text(Value(std::string("\xFF")), text);
    TEST_EXPECT_EQ(err.kind(), core::errc::custom);
}

void test_text_roundtrip_for_json_native_shapes() {
    const Value tree(Array{Value(Object{{"k", Value(-5)}}), Value("x"), Value(2.5)});
    std::string text;
    TEST_EXPECT_OK(utils::to_json_text(tree, text, 2));
    Value back;
    TEST_EXPECT_OK(utils::from_json_text(text, back));
    TEST_EXPECT(back == tree);
}

} // namespace

int main() {
    test_to_json_text_compact();
    test_blob_and_non_finite_floats_become_strings();
    test_from_json_text();
    test_from_json_text_rejects_malformed_input();
    test_from_json_text_bounds_nesting_depth();
    test_to_json_text_rejects_invalid_utf8();
    test_text_roundtrip_for_json_native_shapes();
    return ::binjson::tests::run_and_report();
}
