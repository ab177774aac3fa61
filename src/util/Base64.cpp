#include "proxygate/util/Base64.hpp"

#include <cstdint>

namespace proxygate::util {
namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decodeChar(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace

std::string base64Encode(std::string_view input) {
    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    std::uint32_t value = 0;
    int bitCount = -6;
    for (unsigned char c : input) {
        value = (value << 8) | c;
        bitCount += 8;
        while (bitCount >= 0) {
            output.push_back(kAlphabet[(value >> bitCount) & 0x3F]);
            bitCount -= 6;
        }
    }

    if (bitCount > -6) {
        output.push_back(kAlphabet[((value << 8) >> (bitCount + 8)) & 0x3F]);
    }
    while (output.size() % 4 != 0) {
        output.push_back('=');
    }
    return output;
}

std::optional<std::string> base64Decode(std::string_view input) {
    std::string output;
    output.reserve((input.size() / 4) * 3);

    std::uint32_t value = 0;
    int bitCount = -8;
    std::size_t padding = 0;
    for (unsigned char c : input) {
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) {
            return std::nullopt;
        }
        int decoded = decodeChar(c);
        if (decoded < 0) {
            return std::nullopt;
        }
        value = (value << 6) | static_cast<std::uint32_t>(decoded);
        bitCount += 6;
        if (bitCount >= 0) {
            output.push_back(static_cast<char>((value >> bitCount) & 0xFF));
            bitCount -= 8;
        }
    }
    if (padding > 2) {
        return std::nullopt;
    }
    return output;
}

} // namespace proxygate::util
