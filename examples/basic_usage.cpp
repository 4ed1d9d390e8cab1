#include <binjson/binjson.hpp>
#include <binjson/utils/value_dump.hpp>

#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

using namespace binjson;
using serde::field;
using serde::fields;

namespace {

struct Sensor {
    std::uint32_t id{0};
    std::string name;
    std::optional<double> offset;
    std::map<std::string, std::string> labels;

    template <class Self>
    static auto describe(Self &self) {
        return fields(field("id", self.id),
                      field("name", self.name),
                      field("offset", self.offset),
                      field("labels", self.labels));
    }
};

struct Reset {
    static constexpr std::string_view tag = "Reset";
};

struct Configure {
    static constexpr std::string_view tag = "Configure";
    Sensor value;
};

struct Calibrate {
    static constexpr std::string_view tag = "Calibrate";
    double low{0.0};
    double high{0.0};

    template <class Self>
    static auto describe(Self &self) {
        return fields(field("low", self.low), field("high", self.high));
    }
};

using Command = std::variant<Reset, Configure, Calibrate>;

void print_hex(const std::vector<byte> &bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        std::cout << (i == 0 ? "" : " ") << kDigits[bytes[i] >> 4] << kDigits[bytes[i] & 0x0F];
    }
    std::cout << "\n";
}

} // namespace

int main() {
    std::cout << "=== binjson 基本用法 ===\n\n";

    // 失败路径的诊断日志
    core::set_log_level(core::LogLevel::debug);

    Sensor sensor;
    sensor.id = 7;
    sensor.name = "thermo";
    sensor.labels = {{"site", "lab-2"}};

    const std::vector<Command> commands{Reset{}, Configure{sensor}, Calibrate{-40.0, 125.0}};

    // 类型化值 -> Value
    Value tree;
    if (auto err = to_value(commands, tree)) {
        std::cerr << "to_value 失败: " << err.message() << "\n";
        return 1;
    }
    std::cout << utils::dump_value(tree) << "\n\n";

    // 类型化值 -> 字节
    std::vector<byte> bytes;
    if (auto err = to_bytes(commands, bytes)) {
        std::cerr << "to_bytes 失败: " << err.message() << "\n";
        return 1;
    }
    std::cout << "编码成功: " << bytes.size() << " 字节\n";
    print_hex(bytes);

    // 字节 -> 类型化值
    std::vector<Command> decoded;
    if (auto err = from_bytes(bytes, decoded)) {
        std::cerr << "from_bytes 失败: " << err.message() << "\n";
        return 1;
    }
    std::cout << "解码成功: " << decoded.size() << " 条命令\n";
    if (const auto *configure = std::get_if<Configure>(&decoded[1])) {
        std::cout << "Configure: id=" << configure->value.id << " name=" << configure->value.name
                  << " offset=" << (configure->value.offset ? "present" : "absent") << "\n";
    }

    // 形状不匹配时返回带上下文的错误
    std::uint8_t small = 0;
    const auto err = from_value(Value(300), small);
    std::cout << "\n预期的失败: " << err.message() << "\n";
    return 0;
}
