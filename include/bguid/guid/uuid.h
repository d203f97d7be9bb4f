/**
 * @file uuid.h
 * @brief 128-bit UUID value type
 *
 * Thin immutable wrapper over libuuid's uuid_t. Canonical text form is
 * 8-4-4-4-12 lowercase hex digits.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace bguid {
namespace guid {

class Uuid {
public:
    static constexpr std::size_t SIZE = 16;
    static constexpr std::size_t STRING_LENGTH = 36;

    using Bytes = std::array<uint8_t, SIZE>;

    /**
     * @brief Nil UUID (all zero bits)
     */
    Uuid();

    explicit Uuid(const Bytes& bytes);

    static Uuid nil();

    /**
     * @brief Generate a random (version 4) UUID
     */
    static Uuid generate();

    /**
     * @brief Parse canonical 8-4-4-4-12 text, either case
     * @throws common::InvalidFormatException if text is not a UUID
     */
    static Uuid parse(const std::string& text);

    /**
     * @brief Parse canonical text
     * @return Parsed UUID, or std::nullopt on error
     */
    static std::optional<Uuid> tryParse(const std::string& text);

    /**
     * @brief Validate UUID format (length, hyphen positions, hex digits)
     */
    static bool isValid(const std::string& text);

    /**
     * @brief Canonical lowercase rendering (36 characters)
     */
    std::string toString() const;

    [[nodiscard]] const Bytes& bytes() const noexcept {
        return bytes_;
    }

    bool isNil() const noexcept;

    /**
     * @brief Version nibble (high 4 bits of byte 6)
     */
    int version() const noexcept;

    friend bool operator==(const Uuid& lhs, const Uuid& rhs) {
        return lhs.bytes_ == rhs.bytes_;
    }

    friend bool operator!=(const Uuid& lhs, const Uuid& rhs) {
        return !(lhs == rhs);
    }

    friend bool operator<(const Uuid& lhs, const Uuid& rhs) {
        return lhs.bytes_ < rhs.bytes_;
    }

private:
    Bytes bytes_;
};

} // namespace guid
} // namespace bguid

namespace std {
template<>
struct hash<bguid::guid::Uuid> {
    size_t operator()(const bguid::guid::Uuid& uuid) const noexcept {
        size_t hash = 0;
        for (uint8_t byte : uuid.bytes()) {
            hash = hash * 31 + byte;
        }
        return hash;
    }
};
} // namespace std
