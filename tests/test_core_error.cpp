#include "binjson/codec/codec.hpp"
#include "binjson/core/error.hpp"

#include "test_main.hpp"

#include <string_view>

namespace {

using binjson::core::errc;
using binjson::core::Error;
using binjson::core::make_error_code;

void test_error_category_and_messages() {
  auto ec = make_error_code(errc::expected);
  TEST_EXPECT_EQ(std::string_view(ec.category().name()), "binjson.core");
  TEST_EXPECT(!ec.message().empty());

  TEST_EXPECT_EQ(make_error_code(errc::eof), make_error_code(errc::eof));
  TEST_EXPECT_EQ(make_error_code(errc::ok).message(), "ok");

  std::error_code unknown(9999, binjson::core::error_category());
  TEST_EXPECT_EQ(unknown.message(), "unknown binjson.core error");
}

void test_default_error_is_success() {
  Error err;
  TEST_EXPECT(!err);
  TEST_EXPECT_EQ(err.kind(), errc::ok);
  TEST_EXPECT_EQ(err.message(), "ok");
  TEST_EXPECT(!err.code());
}

void test_messages_per_kind() {
  TEST_EXPECT_EQ(Error::custom("boom").message(), "custom error: boom");
  TEST_EXPECT_EQ(Error::expected("type integer", "type object").message(),
                 "expected type integer, found type object");
  TEST_EXPECT_EQ(Error::duplicated("id").message(), "field id was duplicated");
  TEST_EXPECT_EQ(Error::missing("id").message(), "field id was missing");
  TEST_EXPECT_EQ(Error::unknown("Jump").message(), "field or variant Jump was unknown");
  TEST_EXPECT_EQ(Error::eof().message(), "unexpected eof");
  TEST_EXPECT_EQ(Error::depth_exceeded(128).message(), "nesting depth exceeds 128");

  const auto codec_err = Error::binary_codec(binjson::codec::make_error_code(binjson::codec::errc::truncated));
  TEST_EXPECT_EQ(codec_err.kind(), errc::binary_codec);
  TEST_EXPECT_EQ(codec_err.cause(), binjson::codec::make_error_code(binjson::codec::errc::truncated));
  TEST_EXPECT_EQ(codec_err.message(), "binary codec error: " + codec_err.cause().message());
}

void test_payload_accessors() {
  const auto err = Error::expected("map with a single key", "extra key \"b\"");
  TEST_EXPECT(static_cast<bool>(err));
  TEST_EXPECT_EQ(err.kind(), errc::expected);
  TEST_EXPECT_EQ(err.code(), make_error_code(errc::expected));
  TEST_EXPECT_EQ(err.primary(), "map with a single key");
  TEST_EXPECT_EQ(err.found(), "extra key \"b\"");
  TEST_EXPECT(!err.cause());
}

void test_equality() {
  TEST_EXPECT(Error::missing("a") == Error::missing("a"));
  TEST_EXPECT(!(Error::missing("a") == Error::missing("b")));
  TEST_EXPECT(!(Error::missing("a") == Error::duplicated("a")));
  TEST_EXPECT(Error{} == Error{});
}

}  // namespace

int main() {
  test_error_category_and_messages();
  test_default_error_is_success();
  test_messages_per_kind();
  test_payload_accessors();
  test_equality();
  return ::binjson::tests::run_and_report();
}
