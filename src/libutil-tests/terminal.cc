#include "pipetoml/util/terminal.hh"

#include <gtest/gtest.h>

namespace pipetoml {

TEST(filterANSIEscapes, emptyString)
{
    ASSERT_EQ(filterANSIEscapes(""), "");
}

TEST(filterANSIEscapes, doesntChangePrintableChars)
{
    std::string s = "09 2q304ruyhr slk2-19024 kjsadh sar f";

    ASSERT_EQ(filterANSIEscapes(s), s);
}

TEST(filterANSIEscapes, removesColourCodes)
{
    ASSERT_EQ(filterANSIEscapes("\e[31;1merror:\e[0m bad"), "error: bad");
}

TEST(filterANSIEscapes, removesOtherSequences)
{
    /* Cursor movement, line erase and a two-byte escape. */
    ASSERT_EQ(filterANSIEscapes("a\e[2Kb\e[10;20Hc\eMd"), "abcd");
}

TEST(filterANSIEscapes, keepsUtf8)
{
    ASSERT_EQ(filterANSIEscapes("«stdin» f\e[35;1móó\e[0m"), "«stdin» fóó");
}

TEST(filterANSIEscapes, truncatedSequenceAtEnd)
{
    ASSERT_EQ(filterANSIEscapes("abc\e["), "abc");
}

} // namespace pipetoml
