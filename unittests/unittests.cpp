#include "Retrace.h"
#include "RetraceException.h"
#include <gtest/gtest.h>

using namespace retrace;

namespace
{
    // Length of matched prefix, or -1 when not matched
    long MatchLength(const std::string &re, const std::string &str)
    {
        std::size_t length = 0;
        if (MatchPattern(re, str, &length))
            return static_cast<long>(length);
        return -1;
    }
} // namespace

TEST(MatchPattern, Literal)
{
    EXPECT_EQ(0, MatchLength("", ""));
    EXPECT_EQ(0, MatchLength("", "abc"));
    EXPECT_EQ(1, MatchLength("a", "a"));
    EXPECT_EQ(3, MatchLength("abc", "abc"));
    EXPECT_EQ(3, MatchLength("abc", "abcdef"));
    EXPECT_EQ(-1, MatchLength("abc", "ab"));
}

TEST(MatchPattern, Anchored)
{
    EXPECT_EQ(-1, MatchLength("bc", "abc"));
    EXPECT_EQ(-1, MatchLength("a", ""));
}

TEST(MatchPattern, Wildcard)
{
    EXPECT_EQ(1, MatchLength(".", "a"));
    EXPECT_EQ(1, MatchLength(".", "\n"));
    EXPECT_EQ(-1, MatchLength(".", ""));
    EXPECT_EQ(3, MatchLength("a.c", "axc"));
}

TEST(MatchPattern, ZeroOrOne)
{
    EXPECT_EQ(3, MatchLength("ab?c", "abc"));
    EXPECT_EQ(2, MatchLength("ab?c", "ac"));
    EXPECT_EQ(0, MatchLength("a?", ""));
    EXPECT_EQ(1, MatchLength("a?", "aa"));
}

TEST(MatchPattern, ZeroOrMore)
{
    EXPECT_EQ(10, MatchLength("ab*c*", "abbbbbcccc"));
    EXPECT_EQ(1, MatchLength("ab*c*", "a"));
    EXPECT_EQ(0, MatchLength(".*", ""));
    EXPECT_EQ(3, MatchLength(".*", "abc"));
}

TEST(MatchPattern, OneOrMore)
{
    EXPECT_EQ(-1, MatchLength("ab+c", "ac"));
    EXPECT_EQ(3, MatchLength("ab+c", "abc"));
    EXPECT_EQ(4, MatchLength("ab+c", "abbc"));
    EXPECT_EQ(4, MatchLength("(ab)+", "ababa"));
}

TEST(MatchPattern, Backtracking)
{
    EXPECT_EQ(3, MatchLength("a.*c", "abc"));
    EXPECT_EQ(3, MatchLength("abc*c", "abc"));
    EXPECT_EQ(5, MatchLength("a.*c", "abcbc"));
    EXPECT_EQ(-1, MatchLength("a.*c", "abd"));
    EXPECT_EQ(1, MatchLength("a?a", "a"));
}

TEST(MatchPattern, Groups)
{
    EXPECT_EQ(5, MatchLength("a(bcd)c", "abcdc"));
    EXPECT_EQ(5, MatchLength("ab(cd)c", "abcdc"));
    EXPECT_EQ(2, MatchLength("a(bcd)?c", "ac"));
    EXPECT_EQ(5, MatchLength("a(bcd)?c", "abcdc"));
    EXPECT_EQ(6, MatchLength("a(bc)*d", "abcbcd"));
    EXPECT_EQ(-1, MatchLength("a(bc)*d", "abcbcbd"));
    EXPECT_EQ(3, MatchLength("((a)b)c", "abc"));
    EXPECT_EQ(0, MatchLength("()", "abc"));
}

TEST(MatchPattern, GroupAtEndOfSubject)
{
    EXPECT_EQ(1, MatchLength("a(b*)", "a"));
    EXPECT_EQ(1, MatchLength("a(b?)c?", "a"));
    EXPECT_EQ(-1, MatchLength("a(b)", "a"));
}

TEST(MatchPattern, GroupIsAtomic)
{
    // The group keeps its greedy length, outer backtracking can't shorten it
    EXPECT_EQ(-1, MatchLength("(a*)a", "aaa"));
    EXPECT_EQ(-1, MatchLength("(.*)c", "abc"));
    EXPECT_EQ(3, MatchLength("a*a", "aaa"));
}

TEST(MatchPattern, ZeroLengthRepetition)
{
    EXPECT_EQ(3, MatchLength("(a?)*", "aaa"));
    EXPECT_EQ(0, MatchLength("(a*)*", "bbb"));
    EXPECT_EQ(2, MatchLength("(a*)*b", "ab"));
}

TEST(MatchPattern, Escape)
{
    EXPECT_EQ(1, MatchLength("\\.", "."));
    EXPECT_EQ(-1, MatchLength("\\.", "a"));
    EXPECT_EQ(3, MatchLength("\\(\\*\\)", "(*)"));
    EXPECT_EQ(2, MatchLength("\\\\+", "\\\\"));
}

TEST(MatchPattern, CountsElements)
{
    // Two code points, four bytes
    EXPECT_EQ(2, MatchLength("..", "\xC3\xBF\xC3\xA9"));
    EXPECT_EQ(3, MatchLength("\xC3\xA9+x", "\xC3\xA9\xC3\xA9x"));
    EXPECT_EQ(-1, MatchLength("\xC3\xA9", "\xC3"));
}

TEST(MatchPattern, ParseError)
{
    EXPECT_THROW(MatchPattern("abc\\", "abc"), ParseException);
    EXPECT_THROW(MatchPattern(")", ""), ParseException);
    EXPECT_THROW(MatchPattern("(a", "a"), ParseException);
    EXPECT_THROW(MatchPattern("a**", "aa"), ParseException);
    EXPECT_THROW(MatchPattern("?", ""), ParseException);
}

TEST(MatchPattern, Deterministic)
{
    const char *cases[][2] = {
        { "a.*c", "abcabc" },
        { "(ab)*a?b", "ababab" },
        { "x+y?", "xxxz" },
        { "a(b.)?d", "axd" },
    };

    for (auto &c : cases)
    {
        std::size_t length1 = 0;
        std::size_t length2 = 0;
        auto match1 = MatchPattern(c[0], c[1], &length1);
        auto match2 = MatchPattern(c[0], c[1], &length2);
        EXPECT_EQ(match1, match2) << c[0];
        EXPECT_EQ(length1, length2) << c[0];
    }
}
