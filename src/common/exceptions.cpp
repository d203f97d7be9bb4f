/**
 * @file exceptions.cpp
 * @brief Error code table
 */

#include "bguid/common/exceptions.h"

namespace bguid {
namespace common {

const char* errorCode(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidLength:
            return "INVALID_LENGTH";
        case ErrorKind::InvalidFormat:
            return "INVALID_FORMAT";
        case ErrorKind::InvalidCharacter:
            return "INVALID_CHARACTER";
        case ErrorKind::NullInput:
            return "NULL_INPUT";
        case ErrorKind::ValueOutOfRange:
            return "VALUE_OUT_OF_RANGE";
        case ErrorKind::Config:
            return "CONFIG_ERROR";
    }
    return "UNKNOWN";
}

} // namespace common
} // namespace bguid
