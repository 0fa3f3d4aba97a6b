#include "pipetoml/value/json-to-value.hh"
#include "pipetoml/value/tests/libvalue.hh"

#include <limits>

namespace pipetoml {

class JSONToValueTest : public LibValueTest
{
protected:
    Value parse(std::string_view s)
    {
        Value v;
        parseJSON(s, v);
        return v;
    }
};

TEST_F(JSONToValueTest, Scalars)
{
    ASSERT_EQ(parse("true").type(), nBool);
    ASSERT_EQ(parse("-5").integer(), -5);
    ASSERT_EQ(parse("1.5").fpoint(), 1.5);
    ASSERT_EQ(parse("\"foo\"").string(), "foo");
}

TEST_F(JSONToValueTest, NullIsNothing)
{
    ASSERT_EQ(parse("null").type(), nNothing);
}

TEST_F(JSONToValueTest, LargeUnsignedBecomesFloat)
{
    auto v = parse("18446744073709551615");
    ASSERT_EQ(v.type(), nFloat);
    ASSERT_EQ(v.fpoint(), 18446744073709551615.0);

    ASSERT_EQ(parse("9223372036854775807").integer(), std::numeric_limits<ValueInt>::max());
}

TEST_F(JSONToValueTest, ObjectKeepsKeyOrder)
{
    auto v = parse(R"({"zeta": 1, "alpha": {"x": null}, "mid": [1, 2]})");

    ASSERT_EQ(v.type(), nRecord);
    ASSERT_EQ(v.record().cols, (std::vector<std::string>{"zeta", "alpha", "mid"}));
    ASSERT_EQ(v.record().get("alpha")->type(), nRecord);
    ASSERT_EQ(v.record().get("mid")->listItems().size(), 2u);
}

TEST_F(JSONToValueTest, DuplicateKeyKeepsLastValue)
{
    auto v = parse(R"({"a": 1, "b": 2, "a": 3})");

    ASSERT_EQ(v.record().cols, (std::vector<std::string>{"a", "b"}));
    ASSERT_EQ(v.record().get("a")->integer(), 3);
}

TEST_F(JSONToValueTest, NestedLists)
{
    auto v = parse("[[], [{}], [1, [2]]]");

    ASSERT_EQ(v.type(), nList);
    auto & elems = v.listItems();
    ASSERT_EQ(elems.size(), 3u);
    ASSERT_TRUE(elems[0].listItems().empty());
    ASSERT_EQ(elems[1].listItems()[0].type(), nRecord);
    ASSERT_EQ(elems[2].listItems()[1].listItems()[0].integer(), 2);
}

TEST_F(JSONToValueTest, RootCarriesOrigin)
{
    auto source = std::make_shared<const std::string>("{}");
    Value v;
    parseJSON(*source, v, Pos::Stdin{.source = source});

    ASSERT_NE(v.pos, nullptr);
    ASSERT_EQ(v.pos->line, 1u);
    ASSERT_EQ(v.pos->column, 1u);
    ASSERT_TRUE(std::holds_alternative<Pos::Stdin>(v.pos->origin));
}

TEST_F(JSONToValueTest, InvalidJSON)
{
    ASSERT_THROW(parse(""), JSONParseError);
    ASSERT_THROW(parse("{\"a\": }"), JSONParseError);
    ASSERT_THROW(parse("1 2"), JSONParseError);
}

TEST_F(JSONToValueTest, ParseErrorPosition)
{
    auto source = std::make_shared<const std::string>("{\n  \"a\": ]\n}");
    Value v;

    try {
        parseJSON(*source, v, Pos::Stdin{.source = source});
        FAIL() << "expected a JSONParseError";
    } catch (JSONParseError & e) {
        auto pos = e.info().pos;
        ASSERT_NE(pos, nullptr);
        ASSERT_EQ(pos->line, 2u);
        ASSERT_EQ(pos->column, 8u);
        ASSERT_THAT(e, HasMessage("at «stdin»:2:8:"));
    }
}

TEST_F(JSONToValueTest, NestingUpToTheLimit)
{
    Value v;

    ASSERT_NO_THROW(parseJSON("[[[1]]]", v, std::monostate(), 3));
    ASSERT_NO_THROW(parseJSON(R"({"a": {"b": [1]}})", v, std::monostate(), 3));
}

TEST_F(JSONToValueTest, NestingPastTheLimit)
{
    Value v;

    ASSERT_THROW(parseJSON("[[[[1]]]]", v, std::monostate(), 3), StackOverflowError);
    ASSERT_THROW(parseJSON(R"({"a": {"b": {"c": {}}}})", v, std::monostate(), 3), StackOverflowError);
}

TEST_F(JSONToValueTest, SiblingsDoNotAddToTheDepth)
{
    Value v;

    ASSERT_NO_THROW(parseJSON("[[1], [2], {\"a\": [3]}]", v, std::monostate(), 3));
}

TEST_F(JSONToValueTest, DeeplyNestedInputIsRejected)
{
    ASSERT_THROW(parse(std::string(100000, '[')), StackOverflowError);
    ASSERT_THROW(parse(std::string(100000, '[') + std::string(100000, ']')), StackOverflowError);
}

TEST_F(JSONToValueTest, ParsedInputConvertsToTOML)
{
    Value v;
    parseJSON(R"({"name": "pipetoml", "tags": ["a", "b"]})", v);

    ASSERT_EQ(convert(v), parseEmbeddedTOML("name = \"pipetoml\"\ntags = [\"a\", \"b\"]\n", nullptr));
}

} // namespace pipetoml
