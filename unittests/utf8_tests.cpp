#include "RetraceUtf8.h"
#include <gtest/gtest.h>

using namespace retrace;

TEST(Utf8, Ascii)
{
    std::vector<int> expected = { 'a', 'b', 'c' };
    EXPECT_EQ(expected, utf8::Decode("abc"));
    EXPECT_TRUE(utf8::Decode("").empty());
}

TEST(Utf8, MultiByte)
{
    // U+00E9, U+4E2D, U+1F600
    std::vector<int> expected = { 0xE9, 0x4E2D, 0x1F600 };
    EXPECT_EQ(expected, utf8::Decode("\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x98\x80"));
}

TEST(Utf8, Malformed)
{
    // Stray continuation byte
    std::vector<int> expected1 = { 'a', -0x80, 'b' };
    EXPECT_EQ(expected1, utf8::Decode("a\x80" "b"));

    // Truncated sequence
    std::vector<int> expected2 = { -0xE4, -0xB8 };
    EXPECT_EQ(expected2, utf8::Decode("\xE4\xB8"));

    // Overlong '/'
    std::vector<int> expected3 = { -0xC0, -0xAF };
    EXPECT_EQ(expected3, utf8::Decode("\xC0\xAF"));

    // Surrogate U+D800
    std::vector<int> expected4 = { -0xED, -0xA0, -0x80 };
    EXPECT_EQ(expected4, utf8::Decode("\xED\xA0\x80"));
}

TEST(Utf8, Encode)
{
    std::string str = "x\xC3\xA9\xF0\x9F\x98\x80\xFFy";
    auto elements = utf8::Decode(str);
    EXPECT_EQ(5u, elements.size());
    EXPECT_EQ(str, utf8::Encode(elements.data(), elements.data() + elements.size()));
}
