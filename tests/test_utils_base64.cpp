#include "test_main.hpp"

#include "binjson/utils/base64.hpp"

#include <cstddef>
#include <string>
#include <system_error>
#include <vector>

using namespace binjson;

namespace {

void test_base64_vectors() {
    const std::string text = "foobar";
    const std::vector<core::byte> bytes(text.begin(), text.end());
    const auto prefix = [&](std::size_t n) {
        return utils::encode_base64(core::bytes_view{bytes.data(), n});
    };
    TEST_EXPECT_EQ(prefix(0), std::string(""));
    TEST_EXPECT_EQ(prefix(1), std::string("Zg=="));
    TEST_EXPECT_EQ(prefix(2), std::string("Zm8="));
    TEST_EXPECT_EQ(prefix(3), std::string("Zm9v"));
    TEST_EXPECT_EQ(prefix(6), std::string("Zm9vYmFy"));

    const std::vector<core::byte> binary{0x00, 0xFB, 0xFF};
    TEST_EXPECT_EQ(utils::encode_base64(binary), std::string("APv/"));
}

void test_base64_decode() {
    std::vector<core::byte> out;
    TEST_EXPECT_OK(utils::decode_base64("Zm9vYg==", out));
    TEST_EXPECT_EQ(out, (std::vector<core::byte>{'f', 'o', 'o', 'b'}));

    TEST_EXPECT_OK(utils::decode_base64("Zm8=", out));
    TEST_EXPECT_EQ(out, (std::vector<core::byte>{'f', 'o'}));

    TEST_EXPECT_OK(utils::decode_base64("APv/", out));
    TEST_EXPECT_EQ(out, (std::vector<core::byte>{0x00, 0xFB, 0xFF}));

    TEST_EXPECT_OK(utils::decode_base64("", out));
    TEST_EXPECT(out.empty());
}

void test_base64_decode_errors_leave_output() {
    const std::vector<core::byte> before{0x01};
    const auto invalid = std::make_error_code(std::errc::invalid_argument);

    std::vector<core::byte> out = before;
    TEST_EXPECT_EQ(utils::decode_base64("Zm9", out), invalid);
    TEST_EXPECT_EQ(utils::decode_base64("Zm9v!A==", out), invalid);
    TEST_EXPECT_EQ(utils::decode_base64("Z=9v", out), invalid);
    TEST_EXPECT_EQ(utils::decode_base64("Zm 9", out), invalid);
    TEST_EXPECT_EQ(out, before);
}

} // namespace

int main() {
    test_base64_vectors();
    test_base64_decode();
    test_base64_decode_errors_leave_output();
    return ::binjson::tests::run_and_report();
}
