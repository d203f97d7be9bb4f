/**
 * @file base32.cpp
 * @brief Crockford base-32 integer codec implementation
 */

#include "bguid/codec/base32.h"
#include "bguid/common/exceptions.h"
#include "bguid/utils/string_utils.h"

namespace bguid {
namespace codec {

namespace {

constexpr uint8_t INVALID_DIGIT = 32;

// ASCII -> digit value, INVALID_DIGIT for symbols outside the alphabet
const uint8_t REVERSE_TABLE[128] = {
    32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32,
    32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32,
    32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32,
     0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 32, 32, 32, 32, 32, 32,
    32, 10, 11, 12, 13, 14, 15, 16, 17, 32, 18, 19, 32, 20, 21, 32,
    22, 23, 24, 25, 26, 32, 27, 28, 29, 30, 31, 32, 32, 32, 32, 32,
    32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32,
    32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32, 32};

} // anonymous namespace

std::string encode(uint64_t value) {
    char buffer[MAX_DIGITS_64];
    std::size_t index = MAX_DIGITS_64;

    do {
        buffer[--index] = ALPHABET[value & 0x1F];
        value >>= BITS_PER_DIGIT;
    } while (value != 0);

    return std::string(buffer + index, MAX_DIGITS_64 - index);
}

int digitValue(char c) noexcept {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (uc > 127 || REVERSE_TABLE[uc] == INVALID_DIGIT) {
        return -1;
    }
    return REVERSE_TABLE[uc];
}

uint64_t decode(const std::string& text) {
    uint64_t value = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        int digit = digitValue(text[i]);
        if (digit < 0) {
            throw common::InvalidCharacterException(text[i], i);
        }
        value = (value << BITS_PER_DIGIT) | static_cast<uint64_t>(digit);
    }
    return value;
}

std::string toHex(uint64_t value) {
    return utils::toHex(value, 8);
}

std::string decodeToHex(const std::string& text) {
    return toHex(decode(text));
}

bool isValidChar(char c) noexcept {
    return digitValue(c) >= 0;
}

bool isValid(const std::string& text) noexcept {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!isValidChar(c)) {
            return false;
        }
    }
    return true;
}

} // namespace codec
} // namespace bguid
