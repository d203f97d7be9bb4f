/**
 * @file exceptions.h
 * @brief Exception hierarchy for Beautiful GUID conversions
 *
 * Every failure raised by the library derives from BeautifulGuidException
 * and carries a stable error code alongside the human-readable message.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace bguid {
namespace common {

/**
 * @brief Error categories reported by the library
 */
enum class ErrorKind {
    InvalidLength,
    InvalidFormat,
    InvalidCharacter,
    NullInput,
    ValueOutOfRange,
    Config
};

/**
 * @brief Stable error code for an ErrorKind (e.g. "INVALID_FORMAT")
 */
const char* errorCode(ErrorKind kind) noexcept;

/**
 * @brief Base exception for all Beautiful GUID errors
 */
class BeautifulGuidException : public std::runtime_error {
private:
    ErrorKind kind_;

public:
    BeautifulGuidException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind getKind() const noexcept {
        return kind_;
    }

    [[nodiscard]] std::string getCode() const {
        return errorCode(kind_);
    }
};

/**
 * @brief Canonical UUID rendering is not 36 characters
 */
class InvalidLengthException : public BeautifulGuidException {
public:
    explicit InvalidLengthException(const std::string& message)
        : BeautifulGuidException(ErrorKind::InvalidLength, "Invalid length: " + message) {}
};

/**
 * @brief Input text does not have the expected shape
 */
class InvalidFormatException : public BeautifulGuidException {
public:
    explicit InvalidFormatException(const std::string& message)
        : BeautifulGuidException(ErrorKind::InvalidFormat, "Invalid format: " + message) {}
};

/**
 * @brief Character outside the base-32 alphabet
 */
class InvalidCharacterException : public BeautifulGuidException {
private:
    char character_;
    std::size_t position_;

public:
    InvalidCharacterException(char character, std::size_t position)
        : BeautifulGuidException(ErrorKind::InvalidCharacter,
                                 std::string("Invalid base32 character '") + character +
                                 "' at position " + std::to_string(position)),
          character_(character),
          position_(position) {}

    [[nodiscard]] char getCharacter() const noexcept {
        return character_;
    }

    [[nodiscard]] std::size_t getPosition() const noexcept {
        return position_;
    }
};

/**
 * @brief Input reference is absent
 */
class NullInputException : public BeautifulGuidException {
public:
    explicit NullInputException(const std::string& what)
        : BeautifulGuidException(ErrorKind::NullInput, "Null input: " + what) {}
};

/**
 * @brief Decoded group does not fit in 32 bits
 */
class ValueOutOfRangeException : public BeautifulGuidException {
public:
    explicit ValueOutOfRangeException(const std::string& message)
        : BeautifulGuidException(ErrorKind::ValueOutOfRange, "Value out of range: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public BeautifulGuidException {
public:
    explicit ConfigException(const std::string& message)
        : BeautifulGuidException(ErrorKind::Config, "Configuration error: " + message) {}
};

} // namespace common
} // namespace bguid
