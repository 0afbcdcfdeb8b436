// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <toolchat/util.hpp>

using namespace toolchat;

namespace
{

/// Every byte sequence in `s` decodes as complete UTF-8
bool is_valid_utf8(std::string_view s)
{
    size_t i = 0;
    while (i < s.size())
    {
        auto c = static_cast<unsigned char>(s[i]);
        size_t len = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : (c >> 3) == 0x1E ? 4 : 0;
        if (len == 0 || i + len > s.size())
            return false;
        for (size_t k = 1; k < len; ++k)
        {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80)
                return false;
        }
        i += len;
    }
    return true;
}

} // namespace

// =============================================================================
// truncate_safe
// =============================================================================

TEST(TruncateSafeTest, Table)
{
    struct Case
    {
        std::string input;
        size_t max;
        std::string expected;
    };

    // "ü" is two bytes, "🤷" four
    std::vector<Case> cases = {
        {"Hello World", 5, "Hello"},
        {"Hello ", 5, "Hello"},
        {"Hello World", 11, "Hello World"},
        {"Hello World", 15, "Hello World"},
        {"ü", 1, ""},
        {"üü", 3, "ü"},
        {"🤷", 3, ""},
        {"a🤷b", 5, "a🤷"},
        {"a🤷b", 4, "a"},
        {"", 0, ""},
        {"abc", 0, ""},
    };

    for (const auto& c : cases)
        EXPECT_EQ(truncate_safe(c.input, c.max), c.expected) << c.input << " @ " << c.max;
}

TEST(TruncateSafeTest, NeverSplitsCharacters)
{
    std::string text = "Grüße, 世界! 🤷‍♂️ done";
    for (size_t max = 0; max <= text.size(); ++max)
    {
        auto cut = truncate_safe(text, max);
        EXPECT_LE(cut.size(), max);
        EXPECT_TRUE(is_valid_utf8(cut)) << "max=" << max;
        EXPECT_EQ(text.compare(0, cut.size(), cut), 0);
    }
}

// =============================================================================
// truncate_safe_in_place
// =============================================================================

TEST(TruncateSafeInPlaceTest, FitsIsNoOp)
{
    std::string s = "short";
    truncate_safe_in_place(s, 5, kTruncatedSuffix);
    EXPECT_EQ(s, "short");
}

TEST(TruncateSafeInPlaceTest, AppendsSuffix)
{
    std::string s = "abcdefghij";
    truncate_safe_in_place(s, 8, "...");
    EXPECT_EQ(s, "abcde...");
}

TEST(TruncateSafeInPlaceTest, CutsOnCharacterBoundaryBeforeSuffix)
{
    std::string s = "aüüüüü";
    truncate_safe_in_place(s, 7, "...");
    EXPECT_EQ(s, "aü...");
}

TEST(TruncateSafeInPlaceTest, SuffixLargerThanBudgetHardCuts)
{
    std::string s(100, 'x');
    truncate_safe_in_place(s, 10, kTruncatedSuffix);
    EXPECT_EQ(s, std::string(10, 'x'));
}

TEST(TruncateSafeInPlaceTest, Properties)
{
    std::string base = "ünïcödé text with 🤷 and more ünïcödé text 世界 ";
    std::string input;
    for (int i = 0; i < 40; ++i)
        input += base;

    for (size_t max : {0u, 1u, 33u, 34u, 35u, 100u, 1000u, 5000u})
    {
        std::string s = input;
        truncate_safe_in_place(s, max, kTruncatedSuffix);

        EXPECT_LE(s.size(), max);
        EXPECT_LE(s.size(), input.size());
        EXPECT_TRUE(is_valid_utf8(s)) << "max=" << max;

        // Idempotent
        std::string again = s;
        truncate_safe_in_place(again, max, kTruncatedSuffix);
        EXPECT_EQ(again, s);
    }
}

// =============================================================================
// Sanitization
// =============================================================================

TEST(SanitizeUnicodeTagsTest, KeepsVisibleText)
{
    std::string text = "Hello, 世界! café 🤷";
    EXPECT_EQ(sanitize_unicode_tags(text), text);
}

TEST(SanitizeUnicodeTagsTest, RemovesHiddenCharacters)
{
    // U+E0041 TAG LATIN CAPITAL LETTER A, U+200B ZERO WIDTH SPACE, U+2060 WORD JOINER
    std::string text = "ab\xF3\xA0\x81\x81" "c\xE2\x80\x8B" "d\xE2\x81\xA0" "e";
    EXPECT_EQ(sanitize_unicode_tags(text), "abcde");
}

TEST(SanitizeUnicodeTagsTest, LargeMixture)
{
    std::string hidden = "\xF3\xA0\x80\x81\xE2\x80\x8D";
    std::string input;
    std::string expected;
    for (int i = 0; i < 1000; ++i)
    {
        input += "word" + hidden;
        expected += "word";
    }
    EXPECT_EQ(sanitize_unicode_tags(input), expected);
}

TEST(SanitizeUnicodeTagsTest, InvalidBytesPassThrough)
{
    std::string text = "a\xFF" "b\xC3";
    EXPECT_EQ(sanitize_unicode_tags(text), text);
}

TEST(SanitizeUnicodeTagsTest, HiddenCodePointRanges)
{
    EXPECT_TRUE(is_hidden_code_point(0xE0000));
    EXPECT_TRUE(is_hidden_code_point(0xE007F));
    EXPECT_TRUE(is_hidden_code_point(0x200B));
    EXPECT_FALSE(is_hidden_code_point(0xFEFF));
    EXPECT_TRUE(is_hidden_code_point(0xFFFC));
    EXPECT_FALSE(is_hidden_code_point('a'));
    EXPECT_FALSE(is_hidden_code_point(0x4E16));
}

// =============================================================================
// Token Estimates
// =============================================================================

TEST(TokenCounterTest, CountsCharactersNotBytes)
{
    EXPECT_EQ(TokenCounter::count_tokens(""), 0u);
    EXPECT_EQ(TokenCounter::count_tokens("abcdef"), 2u);
    EXPECT_EQ(TokenCounter::count_tokens("üüü"), 1u);
    EXPECT_EQ(TokenCounter::token_to_chars(200000), 600000u);
}

TEST(DropMatchedContextFilesTest, DropsLargestFirst)
{
    std::vector<ContextFile> files = {
        {"small.md", std::string(30, 'a')},
        {"huge.md", std::string(3000, 'b')},
        {"medium.md", std::string(300, 'c')},
    };

    auto dropped = drop_matched_context_files(files, 150);

    ASSERT_EQ(dropped.size(), 1u);
    EXPECT_EQ(dropped[0].first, "huge.md");
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].first, "medium.md");
    EXPECT_EQ(files[1].first, "small.md");
}

TEST(DropMatchedContextFilesTest, KeepsSmallerFilesThatStillFit)
{
    std::vector<ContextFile> files = {
        {"a", std::string(300, 'a')},
        {"b", std::string(270, 'b')},
        {"c", std::string(60, 'c')},
    };

    // 100 + 90 > 120 drops b, c still fits
    auto dropped = drop_matched_context_files(files, 120);

    ASSERT_EQ(dropped.size(), 1u);
    EXPECT_EQ(dropped[0].first, "b");
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].first, "a");
    EXPECT_EQ(files[1].first, "c");
}

TEST(DropMatchedContextFilesTest, NothingDroppedUnderLimit)
{
    std::vector<ContextFile> files = {{"a", "tiny"}, {"b", "also tiny"}};
    EXPECT_TRUE(drop_matched_context_files(files, 1000).empty());
    EXPECT_EQ(files.size(), 2u);
}
