#include "RetraceParser.h"
#include "RetraceException.h"
#include <gtest/gtest.h>

using namespace retrace;
using namespace retrace::parser;

namespace
{
    ParseError ParseErrorOf(const std::string &re, std::size_t *pos = nullptr)
    {
        try
        {
            Parse(re);
        } catch (const ParseException &e)
        {
            if (pos)
                *pos = e.Position();
            return e.Kind();
        }

        ADD_FAILURE() << "regex \"" << re << "\" parsed without error";
        return ParseError::BadEscape;
    }

    std::unique_ptr<ASTNode> Char(int c, Quantifier q = Quantifier::ExactlyOne)
    {
        return std::unique_ptr<ASTNode>(new CharNode(c, q));
    }
} // namespace

TEST(Parser, Empty)
{
    EXPECT_TRUE(Parse("").empty());
}

TEST(Parser, Sequence)
{
    NodeList expected;
    expected.push_back(Char('a'));
    expected.push_back(Char('b'));
    expected.push_back(Char('c'));

    EXPECT_TRUE(IsSameTree(expected, Parse("abc")));
    EXPECT_EQ("Char('a'){1} Char('b'){1} Char('c'){1}", Dump(Parse("abc")));
}

TEST(Parser, Quantifiers)
{
    EXPECT_EQ("Char('a'){1} Char('b'){?} Char('c'){1}", Dump(Parse("ab?c")));
    EXPECT_EQ("Char('a'){1} Char('b'){*} Char('c'){1}", Dump(Parse("ab*c")));
    EXPECT_EQ("Dot{*}", Dump(Parse(".*")));
}

TEST(Parser, OneOrMoreIsLowered)
{
    NodeList expected;
    expected.push_back(Char('a'));
    expected.push_back(Char('a', Quantifier::ZeroOrMore));

    EXPECT_TRUE(IsSameTree(expected, Parse("a+")));
    EXPECT_EQ("Char('a'){1} Char('b'){1} Char('b'){*} Char('c'){1}",
              Dump(Parse("ab+c")));
}

TEST(Parser, OneOrMoreClonesGroup)
{
    auto nodes = Parse("(ab)+");
    ASSERT_EQ(2u, nodes.size());
    EXPECT_EQ("Group(Char('a'){1} Char('b'){1}){1} Group(Char('a'){1} Char('b'){1}){*}",
              Dump(nodes));
    EXPECT_NE(nodes[0].get(), nodes[1].get());
}

TEST(Parser, Groups)
{
    EXPECT_EQ("Char('a'){1} Group(Char('b'){1} Char('c'){1} Char('d'){1}){?} Char('c'){1}",
              Dump(Parse("a(bcd)?c")));
    EXPECT_EQ("Group(Group(Dot{1}){*}){1}", Dump(Parse("((.)*)")));
    EXPECT_EQ("Group(){1}", Dump(Parse("()")));
}

TEST(Parser, Escape)
{
    EXPECT_EQ("Char('.'){1}", Dump(Parse("\\.")));
    EXPECT_EQ("Char('('){1} Char(')'){*}", Dump(Parse("\\(\\)*")));
    EXPECT_EQ("Char('\\'){1}", Dump(Parse("\\\\")));
    EXPECT_EQ("Char('+'){?}", Dump(Parse("\\+?")));
}

TEST(Parser, OtherCharactersAreLiteral)
{
    EXPECT_EQ("Char('['){1} Char('|'){1} Char('^'){1} Char('$'){1}",
              Dump(Parse("[|^$")));
    EXPECT_EQ("Char(U+00E9){1} Char(U+4E2D){*}", Dump(Parse("\xC3\xA9\xE4\xB8\xAD*")));
}

TEST(Parser, BadEscape)
{
    std::size_t pos = 0;
    EXPECT_EQ(ParseError::BadEscape, ParseErrorOf("ab\\", &pos));
    EXPECT_EQ(2u, pos);
    EXPECT_EQ(ParseError::BadEscape, ParseErrorOf("\\"));
}

TEST(Parser, UnmatchedClose)
{
    std::size_t pos = 0;
    EXPECT_EQ(ParseError::UnmatchedClose, ParseErrorOf(")", &pos));
    EXPECT_EQ(0u, pos);
    EXPECT_EQ(ParseError::UnmatchedClose, ParseErrorOf("(a))", &pos));
    EXPECT_EQ(3u, pos);
}

TEST(Parser, UnmatchedOpen)
{
    std::size_t pos = 0;
    EXPECT_EQ(ParseError::UnmatchedOpen, ParseErrorOf("(a", &pos));
    EXPECT_EQ(0u, pos);
    EXPECT_EQ(ParseError::UnmatchedOpen, ParseErrorOf("a(b(c)", &pos));
    EXPECT_EQ(1u, pos);
}

TEST(Parser, DanglingQuantifier)
{
    std::size_t pos = 0;
    EXPECT_EQ(ParseError::DanglingQuantifier, ParseErrorOf("a**", &pos));
    EXPECT_EQ(2u, pos);
    EXPECT_EQ(ParseError::DanglingQuantifier, ParseErrorOf("a?*"));
    EXPECT_EQ(ParseError::DanglingQuantifier, ParseErrorOf("a+*"));
    EXPECT_EQ(ParseError::DanglingQuantifier, ParseErrorOf("a+?"));
    EXPECT_EQ(ParseError::DanglingQuantifier, ParseErrorOf("*a", &pos));
    EXPECT_EQ(0u, pos);
    EXPECT_EQ(ParseError::DanglingQuantifier, ParseErrorOf("a(*)", &pos));
    EXPECT_EQ(2u, pos);
    EXPECT_EQ(ParseError::DanglingQuantifier, ParseErrorOf("(a)*?"));
}

TEST(Parser, ErrorMessage)
{
    try
    {
        Parse("(abc");
        FAIL() << "expect ParseException";
    } catch (const ParseException &e)
    {
        EXPECT_FALSE(e.What().empty());
    }
}

TEST(Parser, Deterministic)
{
    const char *patterns[] = { "", "a+", "a(b.c)*d?", "((a)+b)?\\+" };
    for (auto re : patterns)
    {
        EXPECT_TRUE(IsSameTree(Parse(re), Parse(re))) << re;
        EXPECT_EQ(Dump(Parse(re)), Dump(Parse(re))) << re;
    }

    EXPECT_FALSE(IsSameTree(Parse("a*"), Parse("a?")));
    EXPECT_FALSE(IsSameTree(Parse("(a)"), Parse("a")));
    EXPECT_FALSE(IsSameTree(Parse("ab"), Parse("a")));
}

TEST(Parser, CloneNodes)
{
    auto nodes = Parse("a(b.)*c");
    auto copy = CloneNodes(nodes);
    EXPECT_TRUE(IsSameTree(nodes, copy));
}
