#include "test_main.hpp"

#include "binjson/utils/value_dump.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace binjson;

namespace {

utils::ValueDumpOptions single_line() {
    utils::ValueDumpOptions options;
    options.multiline = false;
    return options;
}

void test_dump_scalars() {
    TEST_EXPECT_EQ(utils::dump_value(Value::null()), std::string("N"));
    TEST_EXPECT_EQ(utils::dump_value(Value(false)), std::string("B false"));
    TEST_EXPECT_EQ(utils::dump_value(Value(-3)), std::string("I -3"));
    TEST_EXPECT_EQ(utils::dump_value(Value(1.5)), std::string("F 1.5"));
    TEST_EXPECT_EQ(utils::dump_value(Value::blob({0xDE, 0xAD})), std::string("BLOB[2] de ad"));
    TEST_EXPECT_EQ(utils::dump_value(Value::blob({})), std::string("BLOB[0]"));
    TEST_EXPECT_EQ(utils::dump_value(Value("ab")), std::string("S[2] \"ab\""));
}

void test_dump_string_escapes() {
    // 引号、反斜杠与控制字符被转义。
    TEST_EXPECT_EQ(utils::dump_value(Value("a\"b\\\n")), std::string("S[5] \"a\\\"b\\\\\\x0a\""));
}

void test_dump_payload_truncation() {
    utils::ValueDumpOptions options;
    options.max_payload_bytes = 2;
    TEST_EXPECT_EQ(utils::dump_value(Value("hello"), options), std::string("S[5] \"he...\""));
    TEST_EXPECT_EQ(utils::dump_value(Value::blob({1, 2, 3}), options), std::string("BLOB[3] 01 02 ..."));

    options.max_payload_bytes = 0;
    TEST_EXPECT_EQ(utils::dump_value(Value("hello"), options), std::string("S[5] \"hello\""));
}

void test_dump_multiline_containers() {
    const Value arr(Array{Value(1), Value("ab")});
    TEST_EXPECT_EQ(utils::dump_value(arr), std::string("A[2] {\n  I 1\n  S[2] \"ab\"\n}"));

    const Value obj(Object{{"k", Value(true)}});
    TEST_EXPECT_EQ(utils::dump_value(obj), std::string("O[1] {\n  k: B true\n}"));

    const Value nested(Array{Value(Array{Value(1)})});
    TEST_EXPECT_EQ(utils::dump_value(nested), std::string("A[1] {\n  A[1] {\n    I 1\n  }\n}"));

    TEST_EXPECT_EQ(utils::dump_value(Value(Array{})), std::string("A[0]"));
    TEST_EXPECT_EQ(utils::dump_value(Value(Object{})), std::string("O[0]"));
}

void test_dump_single_line_and_limits() {
    const Value arr(Array{Value(1), Value(2), Value(3)});
    TEST_EXPECT_EQ(utils::dump_value(arr, single_line()), std::string("A[3] { I 1, I 2, I 3 }"));

    auto options = single_line();
    options.max_container_items = 2;
    TEST_EXPECT_EQ(utils::dump_value(arr, options), std::string("A[3] { I 1, I 2, ... }"));

    options = single_line();
    options.max_depth = 0;
    TEST_EXPECT_EQ(utils::dump_value(arr, options), std::string("A[3] ..."));

    const Value obj(Object{{"x", Value(Array{Value::null()})}});
    TEST_EXPECT_EQ(utils::dump_value(obj, single_line()), std::string("O[1] { x: A[1] { N } }"));
}

void test_dump_color() {
    utils::ValueDumpOptions options;
    options.enable_color = true;
    const auto colored = utils::dump_value(Value(1), options);
    TEST_EXPECT(colored.find("\033[") != std::string::npos);
    TEST_EXPECT(utils::dump_value(Value(1)).find("\033[") == std::string::npos);
}

} // namespace

int main() {
    test_dump_scalars();
    test_dump_string_escapes();
    test_dump_payload_truncation();
    test_dump_multiline_containers();
    test_dump_single_line_and_limits();
    test_dump_color();
    return ::binjson::tests::run_and_report();
}
