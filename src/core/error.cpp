#include "binjson/core/error.hpp"

#include <string>
#include <utility>

namespace binjson::core {
namespace {

// core::errc 的 std::error_category 实现：
// - name() 用于区分错误域
// - message() 返回不带上下文的英文描述；带上下文的文本见 Error::message()
class binjson_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "binjson.core"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::binary_codec:
        return "binary codec error";
      case errc::custom:
        return "custom error";
      case errc::expected:
        return "unexpected shape";
      case errc::duplicated:
        return "duplicated field";
      case errc::missing:
        return "missing field";
      case errc::unknown:
        return "unknown field or variant";
      case errc::eof:
        return "unexpected eof";
      case errc::depth_exceeded:
        return "nesting depth exceeded";
      default:
        return "unknown binjson.core error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static binjson_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

Error Error::binary_codec(std::error_code cause) {
  Error err(errc::binary_codec, {}, {});
  err.cause_ = cause;
  return err;
}

Error Error::custom(std::string message) {
  return Error(errc::custom, std::move(message), {});
}

Error Error::expected(std::string expected, std::string found) {
  return Error(errc::expected, std::move(expected), std::move(found));
}

Error Error::duplicated(std::string field) {
  return Error(errc::duplicated, std::move(field), {});
}

Error Error::missing(std::string field) {
  return Error(errc::missing, std::move(field), {});
}

Error Error::unknown(std::string name) {
  return Error(errc::unknown, std::move(name), {});
}

Error Error::eof() {
  return Error(errc::eof, {}, {});
}

Error Error::depth_exceeded(std::size_t limit) {
  return Error(errc::depth_exceeded, std::to_string(limit), {});
}

std::string Error::message() const {
  switch (kind_) {
    case errc::ok:
      return "ok";
    case errc::binary_codec:
      return "binary codec error: " + cause_.message();
    case errc::custom:
      return "custom error: " + primary_;
    case errc::expected:
      return "expected " + primary_ + ", found " + found_;
    case errc::duplicated:
      return "field " + primary_ + " was duplicated";
    case errc::missing:
      return "field " + primary_ + " was missing";
    case errc::unknown:
      return "field or variant " + primary_ + " was unknown";
    case errc::eof:
      return "unexpected eof";
    case errc::depth_exceeded:
      return "nesting depth exceeds " + primary_;
  }
  return code().message();
}

}  // namespace binjson::core
