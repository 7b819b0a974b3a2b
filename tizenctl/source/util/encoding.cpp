#include "util/encoding.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace util {

static const char BASE64_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64Encode(const std::string& input) {
    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < input.size()) {
        uint32_t triple = (static_cast<uint8_t>(input[i]) << 16) |
                          (static_cast<uint8_t>(input[i + 1]) << 8) |
                          static_cast<uint8_t>(input[i + 2]);
        out.push_back(BASE64_ALPHABET[(triple >> 18) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(triple >> 12) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(triple >> 6) & 0x3F]);
        out.push_back(BASE64_ALPHABET[triple & 0x3F]);
        i += 3;
    }

    size_t remaining = input.size() - i;
    if (remaining == 1) {
        uint32_t triple = static_cast<uint8_t>(input[i]) << 16;
        out.push_back(BASE64_ALPHABET[(triple >> 18) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(triple >> 12) & 0x3F]);
        out += "==";
    } else if (remaining == 2) {
        uint32_t triple = (static_cast<uint8_t>(input[i]) << 16) |
                          (static_cast<uint8_t>(input[i + 1]) << 8);
        out.push_back(BASE64_ALPHABET[(triple >> 18) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(triple >> 12) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(triple >> 6) & 0x3F]);
        out.push_back('=');
    }

    return out;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

}
