/**
 * @file custom_shape.cpp
 * @brief 演示为自定义类型手写 Serde<T> 特化
 *
 * - Version 以 "major.minor.patch" 文本形式出现在 Value 中；
 * - Span 以两元素 Array 出现，解码时校验 begin <= end。
 */

#include <binjson/binjson.hpp>
#include <binjson/utils/value_dump.hpp>

#include <charconv>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace demo {

struct Version {
    std::uint16_t major{0};
    std::uint16_t minor{0};
    std::uint16_t patch{0};
};

struct Span {
    std::int64_t begin{0};
    std::int64_t end{0};
};

} // namespace demo

namespace binjson::serde {

template <>
struct Serde<demo::Version> {
    class Visitor final : public serde::Visitor {
    public:
        explicit Visitor(demo::Version &out) noexcept : out_(out) {}

        [[nodiscard]] std::string expecting() const override { return "a version string"; }

        core::Error visit_string(std::string v) override {
            demo::Version parsed;
            const char *p = v.data();
            const char *end = v.data() + v.size();
            std::uint16_t *parts[] = {&parsed.major, &parsed.minor, &parsed.patch};
            for (std::size_t i = 0; i < 3; ++i) {
                if (i != 0) {
                    if (p == end || *p != '.') {
                        return invalid_type("string \"" + v + "\"");
                    }
                    ++p;
                }
                const auto [next, ec] = std::from_chars(p, end, *parts[i]);
                if (ec != std::errc{}) {
                    return invalid_type("string \"" + v + "\"");
                }
                p = next;
            }
            if (p != end) {
                return invalid_type("string \"" + v + "\"");
            }
            out_ = parsed;
            return {};
        }

    private:
        demo::Version &out_;
    };

    static core::Error serialize(const demo::Version &v, const Encoder &enc, Value &out) {
        const auto text =
            std::to_string(v.major) + "." + std::to_string(v.minor) + "." + std::to_string(v.patch);
        return enc.encode_string(text, out);
    }

    static core::Error deserialize(Decoder &dec, demo::Version &out) {
        Visitor visitor(out);
        return dec.decode_any(visitor);
    }
};

template <>
struct Serde<demo::Span> {
    class Visitor final : public serde::Visitor {
    public:
        explicit Visitor(demo::Span &out) noexcept : out_(out) {}

        [[nodiscard]] std::string expecting() const override { return "array of length 2"; }

        core::Error visit_seq(SeqAccess &seq) override {
            if (seq.remaining() != 2) {
                return core::Error::expected(expecting(), "array of length " + std::to_string(seq.remaining()));
            }
            std::optional<std::int64_t> begin;
            std::optional<std::int64_t> end;
            if (auto err = seq.next_element(begin)) {
                return err;
            }
            if (auto err = seq.next_element(end)) {
                return err;
            }
            if (*begin > *end) {
                return core::Error::custom("span begin " + std::to_string(*begin) + " is after end " +
                                           std::to_string(*end));
            }
            out_ = demo::Span{*begin, *end};
            return {};
        }

    private:
        demo::Span &out_;
    };

    static core::Error serialize(const demo::Span &v, const Encoder &enc, Value &out) {
        auto seq = enc.encode_seq(2);
        if (auto err = seq.element(v.begin)) {
            return err;
        }
        if (auto err = seq.element(v.end)) {
            return err;
        }
        return seq.end(out);
    }

    static core::Error deserialize(Decoder &dec, demo::Span &out) {
        Visitor visitor(out);
        return dec.decode_any(visitor);
    }
};

} // namespace binjson::serde

namespace demo {

// 自定义形状可以与具名字段结构自由组合。
struct Release {
    Version version;
    std::vector<Span> spans;

    template <class Self>
    static auto describe(Self &self) {
        return binjson::serde::fields(binjson::serde::field("version", self.version),
                                      binjson::serde::field("spans", self.spans));
    }
};

} // namespace demo

int main() {
    const demo::Release release{{1, 4, 2}, {{0, 10}, {20, 35}}};

    binjson::Value tree;
    if (auto err = binjson::to_value(release, tree)) {
        std::cerr << "to_value 失败: " << err.message() << "\n";
        return 1;
    }
    std::cout << binjson::utils::dump_value(tree) << "\n";

    std::vector<binjson::byte> bytes;
    if (auto err = binjson::to_bytes(release, bytes)) {
        std::cerr << "to_bytes 失败: " << err.message() << "\n";
        return 1;
    }

    demo::Release decoded;
    if (auto err = binjson::from_bytes(bytes, decoded)) {
        std::cerr << "from_bytes 失败: " << err.message() << "\n";
        return 1;
    }
    std::cout << "version " << decoded.version.major << "." << decoded.version.minor << "."
              << decoded.version.patch << ", " << decoded.spans.size() << " spans\n";

    // 校验失败
    demo::Span span;
    const auto bad_span = binjson::from_value(
        binjson::Value(binjson::Array{binjson::Value(9), binjson::Value(3)}), span);
    std::cout << "预期的失败: " << bad_span.message() << "\n";

    demo::Version version;
    const auto bad_version = binjson::from_value(binjson::Value("1.x"), version);
    std::cout << "预期的失败: " << bad_version.message() << "\n";
    return 0;
}
