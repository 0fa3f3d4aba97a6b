#include "pipetoml/util/strings.hh"

#include <gtest/gtest.h>

#include <limits>

namespace pipetoml {

/* ----------------------------------------------------------------------------
 * chomp, trim
 * --------------------------------------------------------------------------*/

TEST(chomp, removesTrailingWhitespaceOnly)
{
    ASSERT_EQ(chomp("  foo \t\r\n"), "  foo");
    ASSERT_EQ(chomp(" \n"), "");
    ASSERT_EQ(chomp(""), "");
}

TEST(trim, removesWhitespaceOnBothSides)
{
    ASSERT_EQ(trim("\t foo bar \n"), "foo bar");
    ASSERT_EQ(trim("foo"), "foo");
    ASSERT_EQ(trim("   "), "");
}

/* ----------------------------------------------------------------------------
 * string2Int
 * --------------------------------------------------------------------------*/

TEST(string2Int, parsesDecimalIntegers)
{
    ASSERT_EQ(string2Int<int>("42"), 42);
    ASSERT_EQ(string2Int<int>("-7"), -7);
    ASSERT_EQ(string2Int<unsigned int>("10000"), 10000u);
}

TEST(string2Int, rejectsGarbage)
{
    ASSERT_EQ(string2Int<int>(""), std::nullopt);
    ASSERT_EQ(string2Int<int>("12abc"), std::nullopt);
    ASSERT_EQ(string2Int<int>(" 1"), std::nullopt);
}

TEST(string2Int, rejectsNegativeUnsigned)
{
    ASSERT_EQ(string2Int<unsigned int>("-1"), std::nullopt);
}

TEST(string2Int, rejectsOverflow)
{
    ASSERT_EQ(string2Int<int>("2147483648"), std::nullopt);
    ASSERT_EQ(string2Int<long>("9223372036854775807"), std::numeric_limits<long>::max());
}

/* ----------------------------------------------------------------------------
 * baseNameOf
 * --------------------------------------------------------------------------*/

TEST(baseNameOf, lastComponent)
{
    ASSERT_EQ(baseNameOf("/usr/bin/pipetoml"), "pipetoml");
    ASSERT_EQ(baseNameOf("pipetoml"), "pipetoml");
    ASSERT_EQ(baseNameOf("./pipetoml"), "pipetoml");
}

TEST(baseNameOf, trailingSlashes)
{
    ASSERT_EQ(baseNameOf("/usr/bin//"), "bin");
}

TEST(baseNameOf, rootAndEmpty)
{
    ASSERT_EQ(baseNameOf("/"), "/");
    ASSERT_EQ(baseNameOf(""), "");
}

} // namespace pipetoml
