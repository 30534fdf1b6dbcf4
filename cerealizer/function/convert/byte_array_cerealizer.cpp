#include "byte_array_cerealizer.h"

namespace {
constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decode_char(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

ConversionError malformed(std::string_view why) {
    return ConversionError(ConversionError::Kind::MalformedScalar, "invalid base64: " + std::string(why));
}
}

std::string ByteArrayCerealizer::encode(const std::vector<std::uint8_t>& bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);
    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
        out += kAlphabet[(n >> 18) & 63];
        out += kAlphabet[(n >> 12) & 63];
        out += kAlphabet[(n >> 6) & 63];
        out += kAlphabet[n & 63];
    }
    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t n = bytes[i] << 16;
        out += kAlphabet[(n >> 18) & 63];
        out += kAlphabet[(n >> 12) & 63];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8);
        out += kAlphabet[(n >> 18) & 63];
        out += kAlphabet[(n >> 12) & 63];
        out += kAlphabet[(n >> 6) & 63];
        out += '=';
    }
    return out;
}

std::vector<std::uint8_t> ByteArrayCerealizer::decode(std::string_view text) {
    if (text.size() % 4 != 0) {
        throw malformed("length is not a multiple of 4");
    }
    std::vector<std::uint8_t> out;
    out.reserve(text.size() / 4 * 3);
    for (size_t i = 0; i < text.size(); i += 4) {
        bool last = i + 4 == text.size();
        int pad = 0;
        uint32_t n = 0;
        for (size_t j = 0; j < 4; ++j) {
            char c = text[i + j];
            if (c == '=' && last && j >= 2) {
                ++pad;
                n <<= 6;
                continue;
            }
            int v = decode_char(c);
            if (v < 0 || pad > 0) {
                throw malformed("unexpected character");
            }
            n = (n << 6) | static_cast<uint32_t>(v);
        }
        out.push_back(static_cast<std::uint8_t>((n >> 16) & 0xFF));
        if (pad < 2) out.push_back(static_cast<std::uint8_t>((n >> 8) & 0xFF));
        if (pad < 1) out.push_back(static_cast<std::uint8_t>(n & 0xFF));
    }
    return out;
}

CerealValue ByteArrayCerealizer::to_cereal_typed(const std::vector<std::uint8_t>& object, CerealFactory&) const {
    return CerealValue(encode(object));
}

std::vector<std::uint8_t> ByteArrayCerealizer::from_cereal_typed(const CerealValue& cereal, CerealFactory&) const {
    if (!cereal.is_string()) {
        throw_type_mismatch("base64 string", cereal);
    }
    return decode(cereal.as_string());
}
