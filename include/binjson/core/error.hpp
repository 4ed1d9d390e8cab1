#pragma once

#include <cstddef>
#include <string>
#include <system_error>
#include <utility>

namespace binjson::core {

/**
 * @brief 本库通用错误码（封闭集合，跨模块复用）。
 *
 * 约定：
 * - binary_codec：二进制编解码器失败（底层错误码见 Error::cause()）；
 * - custom：形状描述（Serde<T>）自定义的业务错误；
 * - expected：形状/类型不匹配（期望描述 + 实际描述，均为可读文本）；
 * - duplicated/missing：具名字段重复/缺失；
 * - unknown：未知的字段名或变体名；
 * - eof：需要一个值但没有可用的值；
 * - depth_exceeded：嵌套深度超过 Options::max_depth。
 */
enum class errc : int {
  ok = 0,
  binary_codec = 1,
  custom = 2,
  expected = 3,
  duplicated = 4,
  missing = 5,
  unknown = 6,
  eof = 7,
  depth_exceeded = 8,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

/**
 * @brief 携带上下文的错误值（errc + 可读文本）。
 *
 * 用法与 std::error_code 一致：默认构造表示成功，失败时 `if (err)` 为 true。
 * 文本字段只用于诊断输出，不参与控制流。
 */
class Error final {
 public:
  Error() noexcept = default;

  static Error binary_codec(std::error_code cause);
  static Error custom(std::string message);
  static Error expected(std::string expected, std::string found);
  static Error duplicated(std::string field);
  static Error missing(std::string field);
  static Error unknown(std::string name);
  static Error eof();
  static Error depth_exceeded(std::size_t limit);

  [[nodiscard]] explicit operator bool() const noexcept { return kind_ != errc::ok; }

  [[nodiscard]] errc kind() const noexcept { return kind_; }
  [[nodiscard]] std::error_code code() const noexcept { return make_error_code(kind_); }

  // binary_codec 的底层错误码；其它类别为空。
  [[nodiscard]] std::error_code cause() const noexcept { return cause_; }

  // expected：期望描述；custom：消息；duplicated/missing/unknown：字段或变体名。
  [[nodiscard]] const std::string& primary() const noexcept { return primary_; }

  // expected：实际描述；其它类别为空。
  [[nodiscard]] const std::string& found() const noexcept { return found_; }

  [[nodiscard]] std::string message() const;

  friend bool operator==(const Error&, const Error&) = default;

 private:
  Error(errc kind, std::string primary, std::string found) noexcept
    : kind_(kind), primary_(std::move(primary)), found_(std::move(found)) {}

  errc kind_{errc::ok};
  std::error_code cause_{};
  std::string primary_;
  std::string found_;
};

}  // namespace binjson::core

namespace std {
template <>
struct is_error_code_enum<binjson::core::errc> : true_type {};
}  // namespace std
