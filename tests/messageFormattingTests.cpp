#include "errors.hpp"
#include "networking/messageFormatting.hpp"

#include <gtest/gtest.h>

using namespace p2ps;

TEST(MessageFormattingTest, CommandsMatchCaseInsensitively) {
    EXPECT_TRUE(isCommand("LIST_FILES", LIST_FILES));
    EXPECT_TRUE(isCommand("list_files", LIST_FILES));
    EXPECT_TRUE(isCommand("  Download_File \r", DOWNLOAD_FILE));
    EXPECT_FALSE(isCommand("LIST_FILESX", LIST_FILES));
    EXPECT_FALSE(isCommand("", LIST_FILES));
}

TEST(MessageFormattingTest, ErrorLines) {
    EXPECT_EQ(createNoFileNameError(), "ERROR: No file name provided");
    EXPECT_EQ(createNotFoundError("a.txt"), "ERROR: File not found: a.txt");
    EXPECT_EQ(createUnknownCommandError("HELLO"), "ERROR: Unknown command: HELLO");

    EXPECT_TRUE(isErrorResponse(createUnknownCommandError("x")));
    EXPECT_TRUE(isNotFoundError(createNotFoundError("a.txt")));
    EXPECT_FALSE(isNotFoundError(createNoFileNameError()));
    EXPECT_FALSE(isErrorResponse("OK"));
}

TEST(MessageFormattingTest, ParseCount) {
    EXPECT_EQ(parseCount("0"), std::optional<uint64_t>(0));
    EXPECT_EQ(parseCount("42"), std::optional<uint64_t>(42));
    EXPECT_EQ(parseCount(" 7\r"), std::optional<uint64_t>(7));

    EXPECT_EQ(parseCount(""), std::nullopt);
    EXPECT_EQ(parseCount("-1"), std::nullopt);
    EXPECT_EQ(parseCount("+1"), std::nullopt);
    EXPECT_EQ(parseCount("3 files"), std::nullopt);
    EXPECT_EQ(parseCount("99999999999999999999999"), std::nullopt);
}

TEST(MessageFormattingTest, Trim) {
    EXPECT_EQ(trim("  a b \t\r\n"), "a b");
    EXPECT_EQ(trim(" \t "), "");
}

TEST(ErrorsTest, NamesEveryCode) {
    EXPECT_EQ(errorName(ErrorCode::OK), "OK");
    EXPECT_EQ(errorName(ErrorCode::BIND_ERROR), "BIND_ERROR");
    EXPECT_EQ(errorName(ErrorCode::SHORT_READ_ERROR), "SHORT_READ_ERROR");
    EXPECT_EQ(errorName(ErrorCode::INVALID_NAME), "INVALID_NAME");
}
