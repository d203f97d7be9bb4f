/**
 * @file base32.h
 * @brief Crockford base-32 integer codec
 *
 * Encodes unsigned integers with the alphabet 0123456789ABCDEFGHJKMNPQRSTVWXYZ
 * (no I, L, O or U), most significant digit first and without padding.
 * Decoding is strict: only upper-case alphabet symbols are accepted.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace bguid {
namespace codec {

/// Encoding alphabet, index == digit value
constexpr const char* ALPHABET = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

constexpr unsigned BITS_PER_DIGIT = 5;

/// Digits needed for a 32-bit value
constexpr std::size_t MAX_DIGITS_32 = 7;

/// Digits needed for a 64-bit value
constexpr std::size_t MAX_DIGITS_64 = 13;

/**
 * @brief Encode value as base-32 text
 *
 * @param value Value to encode
 * @return Shortest representation, "0" for zero
 */
std::string encode(uint64_t value);

/**
 * @brief Decode base-32 text into an accumulator
 *
 * Each symbol shifts the accumulator left by 5 bits. Values wider than
 * 64 bits wrap. An empty string decodes to 0.
 *
 * @param text Encoded text
 * @return Decoded value
 * @throws common::InvalidCharacterException on a symbol outside the alphabet
 */
uint64_t decode(const std::string& text);

/**
 * @brief Render a decoded value as upper-case hex padded to at least 8 digits
 */
std::string toHex(uint64_t value);

/**
 * @brief Decode and render with toHex
 *
 * @throws common::InvalidCharacterException on a symbol outside the alphabet
 */
std::string decodeToHex(const std::string& text);

/**
 * @brief Alphabet index of c, or -1
 */
int digitValue(char c) noexcept;

bool isValidChar(char c) noexcept;

/**
 * @brief True if text is non-empty and made only of alphabet symbols
 */
bool isValid(const std::string& text) noexcept;

} // namespace codec
} // namespace bguid
