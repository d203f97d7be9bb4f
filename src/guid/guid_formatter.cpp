/**
 * @file guid_formatter.cpp
 * @brief UUID <-> beautiful GUID conversion
 */

#include "bguid/guid/guid_formatter.h"
#include "bguid/codec/base32.h"
#include "bguid/common/config_manager.h"
#include "bguid/common/exceptions.h"
#include "bguid/utils/string_utils.h"
#include <limits>
#include <vector>
#include <spdlog/spdlog.h>

namespace bguid {
namespace guid {

namespace {

/**
 * @brief Decode one segment to GROUP_HEX_DIGITS (or more) hex digits
 */
std::string decodeGroup(const std::string& segment, std::size_t groupIndex,
                        const DecodeOptions& options) {
    uint64_t value = codec::decode(segment);

    if (!options.allowOversizedGroups) {
        // Digit count first: more than 13 digits wraps the 64-bit accumulator
        std::size_t firstSignificant = segment.find_first_not_of('0');
        std::size_t significantDigits =
            firstSignificant == std::string::npos ? 0 : segment.size() - firstSignificant;

        if (significantDigits > codec::MAX_DIGITS_32 ||
            value > std::numeric_limits<uint32_t>::max()) {
            throw common::ValueOutOfRangeException(
                "group " + std::to_string(groupIndex + 1) + " '" + segment +
                "' does not fit in 32 bits");
        }
    }

    return codec::toHex(value);
}

const char* requireText(const char* text, const char* what) {
    if (text == nullptr) {
        throw common::NullInputException(std::string(what) + " is null");
    }
    return text;
}

} // anonymous namespace

DecodeOptions DecodeOptions::strict() {
    DecodeOptions options;
    options.allowExtraSegments = false;
    options.allowOversizedGroups = false;
    return options;
}

DecodeOptions DecodeOptions::fromConfig(const common::ConfigManager& config) {
    DecodeOptions options;
    options.allowExtraSegments = config.getBool(
        common::ConfigManager::ALLOW_EXTRA_SEGMENTS, options.allowExtraSegments);
    options.allowOversizedGroups = config.getBool(
        common::ConfigManager::ALLOW_OVERSIZED_GROUPS, options.allowOversizedGroups);
    return options;
}

std::string toBeautiful(const Uuid& uuid) {
    std::string text = uuid.toString();

    if (text.length() != Uuid::STRING_LENGTH) {
        throw common::InvalidLengthException(
            "expected " + std::to_string(Uuid::STRING_LENGTH) +
            " characters, got " + std::to_string(text.length()));
    }

    const std::string s1 = text.substr(0, 8);
    const std::string s2 = text.substr(9, 4);
    const std::string s3 = text.substr(14, 4);
    const std::string s4 = text.substr(19, 4);
    const std::string s5 = text.substr(24, 12);

    const std::string groups[GROUP_COUNT] = {
        s1,
        s2 + s3,
        s4 + s5.substr(0, 4),
        s5.substr(4)
    };

    std::vector<std::string> encoded;
    encoded.reserve(GROUP_COUNT);
    for (const auto& group : groups) {
        auto value = utils::parseHex(group);
        if (!value) {
            throw common::InvalidFormatException("'" + group + "' is not hexadecimal");
        }
        encoded.push_back(codec::encode(*value));
    }

    std::string result = utils::join(encoded, "-");
    spdlog::debug("Encoded {} -> {}", text, result);
    return result;
}

std::string toBeautiful(const std::string& uuidText) {
    return toBeautiful(Uuid::parse(uuidText));
}

std::string toBeautiful(const char* uuidText) {
    return toBeautiful(std::string(requireText(uuidText, "UUID text")));
}

std::string fromBeautiful(const char* text, const DecodeOptions& options) {
    return fromBeautiful(std::string(requireText(text, "beautiful GUID text")), options);
}

std::string fromBeautiful(const std::string& text, const DecodeOptions& options) {
    if (text.find(' ') != std::string::npos) {
        throw common::InvalidFormatException("spaces are not allowed in '" + text + "'");
    }

    std::vector<std::string> parts = utils::split(text, '-');

    if (parts.size() < GROUP_COUNT) {
        throw common::InvalidFormatException(
            "expected " + std::to_string(GROUP_COUNT) + " '-' separated groups, got " +
            std::to_string(parts.size()));
    }

    if (parts.size() > GROUP_COUNT) {
        if (!options.allowExtraSegments) {
            throw common::InvalidFormatException(
                "expected " + std::to_string(GROUP_COUNT) + " '-' separated groups, got " +
                std::to_string(parts.size()));
        }
        spdlog::warn("Ignoring {} trailing group(s) in '{}'", parts.size() - GROUP_COUNT, text);
    }

    const std::string n1 = decodeGroup(parts[0], 0, options);
    const std::string n2 = decodeGroup(parts[1], 1, options);
    const std::string n3 = decodeGroup(parts[2], 2, options);
    const std::string n4 = decodeGroup(parts[3], 3, options);

    std::string result = n1 + "-" + n2.substr(0, 4) + "-" + n2.substr(4, 4) + "-" +
                         n3.substr(0, 4) + "-" + n3.substr(4, 4) + n4;

    spdlog::debug("Decoded {} -> {}", text, result);
    return result;
}

Uuid fromBeautifulToUuid(const std::string& text, const DecodeOptions& options) {
    DecodeOptions uuidOptions = options;
    uuidOptions.allowOversizedGroups = false;
    return Uuid::parse(fromBeautiful(text, uuidOptions));
}

Uuid fromBeautifulToUuid(const char* text, const DecodeOptions& options) {
    return fromBeautifulToUuid(std::string(requireText(text, "beautiful GUID text")), options);
}

bool isBeautiful(const std::string& text) {
    std::vector<std::string> parts = utils::split(text, '-');
    if (parts.size() != GROUP_COUNT) {
        return false;
    }

    for (const auto& part : parts) {
        if (!codec::isValid(part)) {
            return false;
        }
        std::size_t firstSignificant = part.find_first_not_of('0');
        if (firstSignificant != std::string::npos &&
            part.size() - firstSignificant > codec::MAX_DIGITS_32) {
            return false;
        }
        if (codec::decode(part) > std::numeric_limits<uint32_t>::max()) {
            return false;
        }
    }

    return true;
}

bool isBeautiful(const char* text) {
    return text != nullptr && isBeautiful(std::string(text));
}

} // namespace guid
} // namespace bguid
