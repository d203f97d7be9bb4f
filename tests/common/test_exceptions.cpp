/**
 * @file test_exceptions.cpp
 * @brief Unit tests for the exception hierarchy
 */

#include <gtest/gtest.h>
#include <bguid/common/exceptions.h>
#include <string>

using namespace bguid::common;

TEST(ExceptionsTest, ErrorCodes) {
    EXPECT_STREQ(errorCode(ErrorKind::InvalidLength), "INVALID_LENGTH");
    EXPECT_STREQ(errorCode(ErrorKind::InvalidFormat), "INVALID_FORMAT");
    EXPECT_STREQ(errorCode(ErrorKind::InvalidCharacter), "INVALID_CHARACTER");
    EXPECT_STREQ(errorCode(ErrorKind::NullInput), "NULL_INPUT");
    EXPECT_STREQ(errorCode(ErrorKind::ValueOutOfRange), "VALUE_OUT_OF_RANGE");
    EXPECT_STREQ(errorCode(ErrorKind::Config), "CONFIG_ERROR");
}

TEST(ExceptionsTest, KindsAreDistinct) {
    NullInputException nullInput("text");
    InvalidFormatException invalidFormat("empty");
    EXPECT_NE(nullInput.getKind(), invalidFormat.getKind());
}

TEST(ExceptionsTest, CatchableAsBase) {
    try {
        throw InvalidLengthException("expected 36 characters, got 35");
    } catch (const BeautifulGuidException& e) {
        EXPECT_EQ(e.getKind(), ErrorKind::InvalidLength);
        EXPECT_EQ(std::string(e.what()), "Invalid length: expected 36 characters, got 35");
    }
}

TEST(ExceptionsTest, CatchableAsRuntimeError) {
    EXPECT_THROW(throw ValueOutOfRangeException("group 1"), std::runtime_error);
    EXPECT_THROW(throw ConfigException("bad level"), std::runtime_error);
}

TEST(ExceptionsTest, InvalidCharacterCarriesDetails) {
    InvalidCharacterException e('U', 4);
    EXPECT_EQ(e.getCharacter(), 'U');
    EXPECT_EQ(e.getPosition(), 4u);
    EXPECT_EQ(std::string(e.what()), "Invalid base32 character 'U' at position 4");
}
