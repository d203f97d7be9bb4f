/**
 * @file guid_formatter.h
 * @brief Conversion between UUIDs and the four-group "beautiful" form
 *
 * The 32 hex digits of a UUID are read as four 32-bit groups:
 *
 *   digits  0-7   field 1
 *   digits  8-15  field 2 + field 3
 *   digits 16-23  field 4 + first 4 digits of field 5
 *   digits 24-31  last 8 digits of field 5
 *
 * Each group is written in Crockford base-32 without padding and the groups
 * are joined with '-': 550e8400-e29b-41d4-a716-446655440000 becomes
 * "1AGX100-3H9PGEM-2KHCH36-1AM8000".
 */

#pragma once

#include "bguid/guid/uuid.h"
#include <cstddef>
#include <string>

namespace bguid {

namespace common {
class ConfigManager;
}

namespace guid {

constexpr std::size_t GROUP_COUNT = 4;

/// Hex digits per decoded group
constexpr std::size_t GROUP_HEX_DIGITS = 8;

/**
 * @brief Decode tolerance settings
 */
struct DecodeOptions {
    /// Ignore segments after the fourth instead of rejecting the input
    bool allowExtraSegments = true;

    /// Accept groups wider than 32 bits (output is then not a canonical UUID)
    bool allowOversizedGroups = false;

    /**
     * @brief Exactly four groups, each within 32 bits
     */
    static DecodeOptions strict();

    /**
     * @brief Read BGUID_ALLOW_EXTRA_SEGMENTS and BGUID_ALLOW_OVERSIZED_GROUPS
     */
    static DecodeOptions fromConfig(const common::ConfigManager& config);
};

/**
 * @brief Convert a UUID to its beautiful form
 *
 * @param uuid UUID value
 * @return Four base-32 groups joined with '-'
 * @throws common::InvalidLengthException if the canonical rendering is not 36 characters
 */
std::string toBeautiful(const Uuid& uuid);

/**
 * @brief Convert canonical UUID text to its beautiful form
 *
 * @param uuidText 8-4-4-4-12 hex text, either case
 * @throws common::InvalidFormatException if uuidText is not a UUID
 */
std::string toBeautiful(const std::string& uuidText);

/**
 * @copydoc toBeautiful(const std::string&)
 * @throws common::NullInputException if uuidText is null
 */
std::string toBeautiful(const char* uuidText);

/**
 * @brief Convert a beautiful GUID back to canonical UUID text
 *
 * @param text Four base-32 groups separated by '-'
 * @param options Decode tolerance settings
 * @return 8-4-4-4-12 upper-case hex text
 * @throws common::InvalidFormatException on spaces or fewer than four groups
 * @throws common::InvalidCharacterException on a symbol outside the alphabet
 * @throws common::ValueOutOfRangeException on a group wider than 32 bits
 */
std::string fromBeautiful(const std::string& text,
                          const DecodeOptions& options = DecodeOptions());

/**
 * @copydoc fromBeautiful(const std::string&, const DecodeOptions&)
 * @throws common::NullInputException if text is null
 */
std::string fromBeautiful(const char* text,
                          const DecodeOptions& options = DecodeOptions());

/**
 * @brief Convert a beautiful GUID back to a Uuid value
 *
 * Rejects oversized groups regardless of options.
 */
Uuid fromBeautifulToUuid(const std::string& text,
                         const DecodeOptions& options = DecodeOptions());

/**
 * @copydoc fromBeautifulToUuid(const std::string&, const DecodeOptions&)
 * @throws common::NullInputException if text is null
 */
Uuid fromBeautifulToUuid(const char* text,
                         const DecodeOptions& options = DecodeOptions());

/**
 * @brief Check text against the strict beautiful GUID format without throwing
 */
bool isBeautiful(const std::string& text);

/**
 * @brief False for null text
 */
bool isBeautiful(const char* text);

} // namespace guid
} // namespace bguid
