/**
 * @file uuid.cpp
 * @brief UUID value type backed by libuuid
 */

#include "bguid/guid/uuid.h"
#include "bguid/common/exceptions.h"
#include <algorithm>
#include <cctype>
#include <uuid/uuid.h>

namespace bguid {
namespace guid {

Uuid::Uuid() {
    bytes_.fill(0);
}

Uuid::Uuid(const Bytes& bytes) : bytes_(bytes) {}

Uuid Uuid::nil() {
    return Uuid();
}

Uuid Uuid::generate() {
    Bytes bytes;
    uuid_generate_random(bytes.data());
    return Uuid(bytes);
}

bool Uuid::isValid(const std::string& text) {
    if (text.length() != STRING_LENGTH) {
        return false;
    }

    for (size_t i = 0; i < text.length(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-') {
                return false;
            }
        } else if (!std::isxdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }

    return true;
}

std::optional<Uuid> Uuid::tryParse(const std::string& text) {
    if (!isValid(text)) {
        return std::nullopt;
    }

    Bytes bytes;
    if (uuid_parse(text.c_str(), bytes.data()) != 0) {
        return std::nullopt;
    }
    return Uuid(bytes);
}

Uuid Uuid::parse(const std::string& text) {
    auto uuid = tryParse(text);
    if (!uuid) {
        throw common::InvalidFormatException(
            "'" + text + "' is not a canonical 8-4-4-4-12 UUID");
    }
    return *uuid;
}

std::string Uuid::toString() const {
    char buffer[STRING_LENGTH + 1];
    uuid_unparse_lower(bytes_.data(), buffer);
    return std::string(buffer);
}

bool Uuid::isNil() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

int Uuid::version() const noexcept {
    return (bytes_[6] >> 4) & 0x0F;
}

} // namespace guid
} // namespace bguid
