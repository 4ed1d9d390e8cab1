#include "binjson/utils/value_dump.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <type_traits>
#include <variant>

namespace binjson::utils {
namespace {

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *tag = "\033[1;35m";
    static constexpr const char *text = "\033[1;32m";
    static constexpr const char *number = "\033[1;33m";
    static constexpr const char *key = "\033[1;36m";
    static constexpr const char *dim = "\033[2m";
};

class Dumper final {
public:
    explicit Dumper(const ValueDumpOptions &options) : options_(options) {}

    void value(const Value &v, std::size_t depth);

    [[nodiscard]] std::string str() const { return out_.str(); }

private:
    [[nodiscard]] const char *color(const char *code) const noexcept {
        return options_.enable_color ? code : "";
    }

    [[nodiscard]] std::size_t limit(std::size_t total, std::size_t max) const noexcept {
        return max == 0 ? total : std::min(total, max);
    }

    [[nodiscard]] std::string indent(std::size_t depth) const {
        return std::string(depth * options_.indent_spaces, ' ');
    }

    void quoted(const std::string &s);
    void blob(const Blob &b);

    // Array 与 Object 共用的容器框架：each(i) 输出第 i 个子元素。
    template <class Each>
    void container(const char *tag, std::size_t total, std::size_t depth, Each &&each);

    ValueDumpOptions options_;
    std::ostringstream out_;
};

void Dumper::quoted(const std::string &s) {
    const std::size_t n = limit(s.size(), options_.max_payload_bytes);

    out_ << color(Ansi::text) << '"';
    for (std::size_t i = 0; i < n; ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c == '\\' || c == '"') {
            out_ << '\\' << static_cast<char>(c);
        } else if (c >= 0x20 && c != 0x7F) {
            // UTF-8 多字节序列原样输出。
            out_ << static_cast<char>(c);
        } else {
            out_ << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c)
                 << std::dec;
        }
    }
    if (n < s.size()) {
        out_ << "...";
    }
    out_ << '"' << color(Ansi::reset);
}

void Dumper::blob(const Blob &b) {
    const auto &bytes = b.value;
    const std::size_t n = limit(bytes.size(), options_.max_payload_bytes);

    out_ << color(Ansi::tag) << "BLOB[" << bytes.size() << ']' << color(Ansi::reset);
    if (bytes.empty()) {
        return;
    }
    out_ << ' ' << color(Ansi::number);
    for (std::size_t i = 0; i < n; ++i) {
        if (i != 0) {
            out_ << ' ';
        }
        out_ << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i])
             << std::dec;
    }
    out_ << color(Ansi::reset);
    if (n < bytes.size()) {
        out_ << ' ' << color(Ansi::dim) << "..." << color(Ansi::reset);
    }
}

template <class Each>
void Dumper::container(const char *tag, std::size_t total, std::size_t depth, Each &&each) {
    const auto *dim = color(Ansi::dim);
    const auto *reset = color(Ansi::reset);
    const std::size_t n = limit(total, options_.max_container_items);
    const bool truncated = n < total;

    out_ << color(Ansi::tag) << tag << '[' << total << ']' << reset;
    if (total == 0) {
        return;
    }
    if (depth >= options_.max_depth) {
        out_ << ' ' << dim << "..." << reset;
        return;
    }

    if (!options_.multiline) {
        out_ << ' ' << dim << "{ " << reset;
        for (std::size_t i = 0; i < n; ++i) {
            if (i != 0) {
                out_ << ", ";
            }
            each(i);
        }
        if (truncated) {
            out_ << ", " << dim << "..." << reset;
        }
        out_ << ' ' << dim << '}' << reset;
        return;
    }

    out_ << ' ' << dim << "{\n" << reset;
    for (std::size_t i = 0; i < n; ++i) {
        out_ << indent(depth + 1);
        each(i);
        out_ << '\n';
    }
    if (truncated) {
        out_ << indent(depth + 1) << dim << "..." << reset << '\n';
    }
    out_ << indent(depth) << dim << '}' << reset;
}

void Dumper::value(const Value &v, std::size_t depth) {
    const auto *tag = color(Ansi::tag);
    const auto *number = color(Ansi::number);
    const auto *reset = color(Ansi::reset);

    std::visit(
        [&](const auto &x) {
            using T = std::decay_t<decltype(x)>;

            if constexpr (std::is_same_v<T, Null>) {
                out_ << tag << 'N' << reset;
            } else if constexpr (std::is_same_v<T, bool>) {
                out_ << tag << "B " << reset << number << (x ? "true" : "false") << reset;
            } else if constexpr (std::is_same_v<T, Blob>) {
                blob(x);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                out_ << tag << "I " << reset << number << x << reset;
            } else if constexpr (std::is_same_v<T, double>) {
                out_ << tag << "F " << reset << number << std::setprecision(17) << x << reset;
            } else if constexpr (std::is_same_v<T, std::string>) {
                out_ << tag << "S[" << x.size() << "] " << reset;
                quoted(x);
            } else if constexpr (std::is_same_v<T, Array>) {
                container("A", x.size(), depth, [&](std::size_t i) { value(x[i], depth + 1); });
            } else {
                // Object：按遍历顺序输出，键与值之间用 ": " 分隔。
                auto it = x.begin();
                container("O", x.size(), depth, [&](std::size_t) {
                    out_ << color(Ansi::key) << it->first << reset << ": ";
                    value(it->second, depth + 1);
                    ++it;
                });
            }
        },
        v.storage());
}

} // namespace

std::string dump_value(const Value &value, ValueDumpOptions options) {
    Dumper dumper(options);
    dumper.value(value, 0);
    return dumper.str();
}

} // namespace binjson::utils
