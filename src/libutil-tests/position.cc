#include "pipetoml/util/position.hh"

#include <gtest/gtest.h>

#include <sstream>

namespace pipetoml {

static Pos::Origin makeStdin(std::string s)
{
    return Pos::Stdin{.source = std::make_shared<const std::string>(std::move(s))};
}

TEST(Pos, print)
{
    std::ostringstream out;
    out << Pos(4, 2, makeStdin("")) << " " << Pos(7, 0, Pos::String{}) << " " << Pos(1, 1, std::monostate());

    ASSERT_EQ(out.str(), "«stdin»:4:2 «string»:7 «none»:1:1");
}

TEST(Pos, unknownPositionIsFalse)
{
    ASSERT_FALSE(static_cast<bool>(Pos()));
    ASSERT_TRUE(static_cast<bool>(Pos(1, 1, std::monostate())));
}

TEST(Pos, getCodeLinesOnFirstLine)
{
    auto loc = Pos(1, 3, makeStdin("[1,\n 2]")).getCodeLines();

    ASSERT_TRUE(loc.has_value());
    ASSERT_EQ(loc->prevLineOfCode, std::nullopt);
    ASSERT_EQ(loc->errLineOfCode, "[1,");
    ASSERT_EQ(loc->nextLineOfCode, " 2]");
}

TEST(Pos, getCodeLinesOnLastLine)
{
    auto loc = Pos(3, 1, makeStdin("a\r\nb\rc")).getCodeLines();

    ASSERT_TRUE(loc.has_value());
    ASSERT_EQ(loc->prevLineOfCode, "b");
    ASSERT_EQ(loc->errLineOfCode, "c");
    ASSERT_EQ(loc->nextLineOfCode, std::nullopt);
}

TEST(Pos, getCodeLinesPastTheEnd)
{
    auto loc = Pos(5, 1, makeStdin("a\nb\n")).getCodeLines();

    ASSERT_TRUE(loc.has_value());
    ASSERT_EQ(loc->errLineOfCode, std::nullopt);
}

TEST(Pos, getCodeLinesWithoutSource)
{
    ASSERT_EQ(Pos(1, 1, std::monostate()).getCodeLines(), std::nullopt);
    ASSERT_EQ(Pos(0, 0, makeStdin("a")).getCodeLines(), std::nullopt);
}

TEST(splitLines, allLineEndings)
{
    ASSERT_EQ(
        splitLines("one\ntwo\r\nthree\rfour"), (std::vector<std::string_view>{"one", "two", "three", "four"}));
}

TEST(splitLines, emptyLinesAreKept)
{
    ASSERT_EQ(splitLines("a\n\nb\n"), (std::vector<std::string_view>{"a", "", "b"}));
    ASSERT_EQ(splitLines(""), std::vector<std::string_view>{});
}

} // namespace pipetoml
