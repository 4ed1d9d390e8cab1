#include "binjson/utils/base64.hpp"

#include <array>
#include <cstdint>
#include <new>
#include <utility>

namespace binjson::utils {
namespace {

constexpr std::string_view kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::uint8_t kInvalid = 0xFF;

constexpr std::array<std::uint8_t, 256> make_reverse_table_() noexcept {
    std::array<std::uint8_t, 256> table{};
    for (auto &entry : table) {
        entry = kInvalid;
    }
    for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

constexpr auto kReverse = make_reverse_table_();

} // namespace

std::string encode_base64(binjson::core::bytes_view bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);

    std::size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        const std::uint32_t chunk = (static_cast<std::uint32_t>(bytes[i]) << 16) |
                                    (static_cast<std::uint32_t>(bytes[i + 1]) << 8) |
                                    static_cast<std::uint32_t>(bytes[i + 2]);
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        out.push_back(kAlphabet[chunk & 0x3F]);
    }

    const std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        const std::uint32_t chunk = static_cast<std::uint32_t>(bytes[i]) << 16;
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        const std::uint32_t chunk = (static_cast<std::uint32_t>(bytes[i]) << 16) |
                                    (static_cast<std::uint32_t>(bytes[i + 1]) << 8);
        out.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        out.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::error_code decode_base64(std::string_view text, std::vector<binjson::core::byte> &out) noexcept {
    if (text.size() % 4 != 0) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    std::vector<binjson::core::byte> tmp;
    try {
        tmp.reserve(text.size() / 4 * 3);
    } catch (const std::bad_alloc &) {
        return std::make_error_code(std::errc::not_enough_memory);
    }

    for (std::size_t i = 0; i < text.size(); i += 4) {
        const bool last = i + 4 == text.size();
        std::size_t padding = 0;
        if (last) {
            padding = (text[i + 3] == '=') + (text[i + 2] == '=' && text[i + 3] == '=');
        }

        std::uint32_t chunk = 0;
        for (std::size_t j = 0; j < 4; ++j) {
            std::uint8_t sextet = 0;
            if (j < 4 - padding) {
                sextet = kReverse[static_cast<unsigned char>(text[i + j])];
                if (sextet == kInvalid) {
                    return std::make_error_code(std::errc::invalid_argument);
                }
            }
            chunk = (chunk << 6) | sextet;
        }

        tmp.push_back(static_cast<binjson::core::byte>((chunk >> 16) & 0xFF));
        if (padding < 2) {
            tmp.push_back(static_cast<binjson::core::byte>((chunk >> 8) & 0xFF));
        }
        if (padding < 1) {
            tmp.push_back(static_cast<binjson::core::byte>(chunk & 0xFF));
        }
    }

    out = std::move(tmp);
    return {};
}

} // namespace binjson::utils
