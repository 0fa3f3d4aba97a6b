#include "pipetoml/value/value.hh"
#include "pipetoml/value/tests/libvalue.hh"

namespace pipetoml {

class ValueTest : public LibValueTest
{};

TEST_F(ValueTest, unsetValue)
{
    Value unsetValue;
    ASSERT_EQ(unsetValue.type(), nNothing);
}

TEST_F(ValueTest, vInt)
{
    Value vInt;
    vInt.mkInt(42);
    ASSERT_EQ(vInt.type(), nInt);
    ASSERT_EQ(vInt.integer(), 42);
}

TEST_F(ValueTest, builderReplacesPayload)
{
    Value v;
    v.mkString("foo").mkBool(true);
    ASSERT_EQ(v.type(), nBool);
    ASSERT_TRUE(v.boolean());
}

TEST_F(ValueTest, typesOfAllKinds)
{
    ASSERT_EQ(Value().mkFloat(1.5).type(), nFloat);
    ASSERT_EQ(Value().mkBinary({1, 2}).type(), nBinary);
    ASSERT_EQ(Value().mkDuration(1000).type(), nDuration);
    ASSERT_EQ(Value().mkDate(Date{.nanoseconds = 0}).type(), nDate);
    ASSERT_EQ(Value().mkFilesize(1024).type(), nFilesize);
    ASSERT_EQ(Value().mkRange(Range{.from = 1, .to = 10}).type(), nRange);
    ASSERT_EQ(Value().mkList({}).type(), nList);
    ASSERT_EQ(Value().mkRecord({}).type(), nRecord);
    ASSERT_EQ(Value().mkBlock(7).type(), nBlock);
    ASSERT_EQ(Value().mkError(std::make_exception_ptr(Error("boom"))).type(), nError);
    ASSERT_EQ(Value().mkCellPath(CellPath{.members = {"a", uint64_t(0)}}).type(), nCellPath);
}

TEST_F(ValueTest, setPos)
{
    auto v = Value().mkInt(1).setPos(std::make_shared<const Pos>(2, 3, std::monostate()));
    ASSERT_EQ(v.pos->line, 2u);
    ASSERT_EQ(v.pos->column, 3u);
}

/* ----------------------------------------------------------------------------
 * Record
 * --------------------------------------------------------------------------*/

TEST_F(ValueTest, recordKeepsInsertionOrder)
{
    Record r;
    r.insert("zeta", mkIntValue(1));
    r.insert("alpha", mkIntValue(2));
    r.insert("mid", mkIntValue(3));

    ASSERT_EQ(r.cols, (std::vector<std::string>{"zeta", "alpha", "mid"}));
    ASSERT_EQ(r.size(), 3u);
}

TEST_F(ValueTest, recordInsertReplacesInPlace)
{
    Record r;
    r.insert("a", mkIntValue(1));
    r.insert("b", mkIntValue(2));
    r.insert("a", mkStringValue("x"));

    ASSERT_EQ(r.cols, (std::vector<std::string>{"a", "b"}));
    ASSERT_EQ(r.vals.size(), r.cols.size());
    ASSERT_EQ(r.get("a")->string(), "x");
}

TEST_F(ValueTest, recordGetMissing)
{
    Record r;
    ASSERT_TRUE(r.empty());
    ASSERT_EQ(r.get("a"), nullptr);
}

/* ----------------------------------------------------------------------------
 * showType
 * --------------------------------------------------------------------------*/

TEST_F(ValueTest, showType)
{
    ASSERT_EQ(showType(nNothing), "nothing");
    ASSERT_EQ(showType(nInt), "an integer");
    ASSERT_EQ(showType(nInt, false), "integer");
    ASSERT_EQ(showType(nFilesize), "a file size");
    ASSERT_EQ(showType(mkListValue({})), "a list");
}

class ColourValue : public CustomValueBase
{
public:
    std::string showType() const override
    {
        return "a colour";
    }

    std::string typeOf() const override
    {
        return "colour";
    }
};

TEST_F(ValueTest, showTypeOfCustomValue)
{
    auto v = Value().mkCustom(std::make_shared<const ColourValue>());
    ASSERT_EQ(v.type(), nCustom);
    ASSERT_EQ(showType(v), "a colour");
    ASSERT_EQ(v.custom().typeOf(), "colour");
}

} // namespace pipetoml
