#include "Base32.hpp"
#include "GeoCryptErrors.hpp"
#include <array>

namespace {

constexpr uint8_t INVALID_DIGIT = 0xFF;

constexpr std::array<uint8_t, 256> makeDecodeTable() {
    std::array<uint8_t, 256> table{};
    for (auto& entry : table) entry = INVALID_DIGIT;
    for (uint8_t i = 0; i < 32; ++i) {
        table[static_cast<unsigned char>(BASE32_ALPHABET[i])] = i;
    }
    return table;
}

constexpr std::array<uint8_t, 256> DECODE_TABLE = makeDecodeTable();

}

std::string encodeBase32(uint64_t x) {
    std::string out(BASE32_DIGITS, '0');
    for (size_t i = BASE32_DIGITS; i-- > 0;) {
        out[i] = BASE32_ALPHABET[x & 0x1F];
        x >>= 5;
    }
    return out;
}

uint64_t decodeBase32(std::string_view text) {
    uint64_t x = 0;
    for (char c : text) {
        if (c < '0' || c > 'z') {
            throw InvalidBase32Error();
        }
        uint8_t v = DECODE_TABLE[static_cast<unsigned char>(c)];
        if (v == INVALID_DIGIT) {
            throw InvalidBase32Error();
        }
        x = (x << 5) | v;
    }
    return x;
}
