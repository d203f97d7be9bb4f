/**
 * @file test_cli.cpp
 * @brief Unit tests for bguid command line handling
 */

#include <gtest/gtest.h>
#include <bguid/cli/cli.h>
#include <bguid/guid/uuid.h>
#include <bguid/utils/string_utils.h>
#include <sstream>

using namespace bguid::cli;
using bguid::guid::DecodeOptions;
using bguid::utils::split;

class CliTest : public ::testing::Test {
protected:
    const std::string sampleUuid = "550e8400-e29b-41d4-a716-446655440000";
    const std::string sampleBeautiful = "1AGX100-3H9PGEM-2KHCH36-1AM8000";

    std::ostringstream out_;
    std::ostringstream err_;

    int runCli(const std::vector<std::string>& args,
               const DecodeOptions& defaults = DecodeOptions()) {
        std::vector<std::string> argv = {"bguid"};
        argv.insert(argv.end(), args.begin(), args.end());
        return run(argv, defaults, out_, err_);
    }
};

// encode
TEST_F(CliTest, Encode_KnownVector) {
    EXPECT_EQ(runCli({"encode", sampleUuid}), EXIT_OK);
    EXPECT_EQ(out_.str(), sampleBeautiful + "\n");
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(CliTest, Encode_SeveralArguments) {
    EXPECT_EQ(runCli({"encode", sampleUuid, "00000000-0000-0000-0000-000000000000"}), EXIT_OK);
    EXPECT_EQ(out_.str(), sampleBeautiful + "\n0-0-0-0\n");
}

TEST_F(CliTest, Encode_BadUuid) {
    EXPECT_EQ(runCli({"encode", "not-a-uuid"}), EXIT_CONVERSION);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliTest, Encode_RejectsUnusedOption) {
    EXPECT_EQ(runCli({"encode", "--count", "3", sampleUuid}), EXIT_USAGE);
    EXPECT_EQ(runCli({"encode", "--lowercase", sampleUuid}), EXIT_USAGE);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_NE(err_.str().find("Usage:"), std::string::npos);
}

TEST_F(CliTest, Encode_MissingArgument) {
    EXPECT_EQ(runCli({"encode"}), EXIT_USAGE);
    EXPECT_TRUE(out_.str().empty());
}

// decode
TEST_F(CliTest, Decode_Uppercase) {
    EXPECT_EQ(runCli({"decode", sampleBeautiful}), EXIT_OK);
    EXPECT_EQ(out_.str(), "550E8400-E29B-41D4-A716-446655440000\n");
}

TEST_F(CliTest, Decode_Lowercase) {
    EXPECT_EQ(runCli({"decode", "--lowercase", sampleBeautiful}), EXIT_OK);
    EXPECT_EQ(out_.str(), sampleUuid + "\n");
}

TEST_F(CliTest, Decode_ExtraGroupTolerated) {
    EXPECT_EQ(runCli({"decode", sampleBeautiful + "-X"}), EXIT_OK);
    EXPECT_EQ(out_.str(), "550E8400-E29B-41D4-A716-446655440000\n");
}

TEST_F(CliTest, Decode_StrictRejectsExtraGroup) {
    EXPECT_EQ(runCli({"decode", "--strict", sampleBeautiful + "-X"}), EXIT_CONVERSION);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliTest, Decode_StrictFromDefaults) {
    EXPECT_EQ(runCli({"decode", sampleBeautiful + "-X"}, DecodeOptions::strict()), EXIT_CONVERSION);
}

TEST_F(CliTest, Decode_InvalidCharacter) {
    EXPECT_EQ(runCli({"decode", "1AGX100-3H9PGEM-2KHCH36-1AM800O"}), EXIT_CONVERSION);
}

TEST_F(CliTest, Decode_RejectsCount) {
    EXPECT_EQ(runCli({"decode", "--count", "2", sampleBeautiful}), EXIT_USAGE);
    EXPECT_TRUE(out_.str().empty());
}

// generate
TEST_F(CliTest, Generate_Default) {
    EXPECT_EQ(runCli({"generate"}), EXIT_OK);
    auto lines = split(out_.str(), '\n');
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE(lines[1].empty());

    auto fields = split(lines[0], ' ');
    ASSERT_EQ(fields.size(), 2u);
    EXPECT_TRUE(bguid::guid::Uuid::isValid(fields[0]));
    EXPECT_EQ(bguid::guid::toBeautiful(fields[0]), fields[1]);
}

TEST_F(CliTest, Generate_Count) {
    EXPECT_EQ(runCli({"generate", "--count", "3"}), EXIT_OK);
    // three lines plus the empty token after the final newline
    EXPECT_EQ(split(out_.str(), '\n').size(), 4u);
}

TEST_F(CliTest, Generate_CountMissingValue) {
    EXPECT_EQ(runCli({"generate", "--count"}), EXIT_USAGE);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliTest, Generate_CountNotPositive) {
    EXPECT_EQ(runCli({"generate", "--count", "0"}), EXIT_USAGE);
    EXPECT_EQ(runCli({"generate", "--count", "-2"}), EXIT_USAGE);
    EXPECT_EQ(runCli({"generate", "--count", "3x"}), EXIT_USAGE);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliTest, Generate_RejectsDecodeOptions) {
    EXPECT_EQ(runCli({"generate", "--lowercase"}), EXIT_USAGE);
    EXPECT_EQ(runCli({"generate", "--strict"}), EXIT_USAGE);
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliTest, Generate_RejectsArguments) {
    EXPECT_EQ(runCli({"generate", sampleUuid}), EXIT_USAGE);
}

// usage
TEST_F(CliTest, Help_GoesToOutput) {
    EXPECT_EQ(runCli({"--help"}), EXIT_OK);
    EXPECT_NE(out_.str().find("Usage:"), std::string::npos);
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(CliTest, UsageErrorsGoToErrorStream) {
    EXPECT_EQ(runCli({}), EXIT_USAGE);
    EXPECT_EQ(runCli({"frobnicate"}), EXIT_USAGE);
    EXPECT_EQ(runCli({"decode", "--bogus", sampleBeautiful}), EXIT_USAGE);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_NE(err_.str().find("Usage:"), std::string::npos);
}

TEST_F(CliTest, ArgcArgvOverload) {
    char program[] = "bguid";
    char command[] = "encode";
    std::string uuid = sampleUuid;
    char* argv[] = {program, command, &uuid[0]};
    EXPECT_EQ(run(3, argv, DecodeOptions(), out_, err_), EXIT_OK);
    EXPECT_EQ(out_.str(), sampleBeautiful + "\n");
}
