#include "pipetoml/value/value-to-toml.hh"
#include "pipetoml/value/tests/libvalue.hh"

#include <limits>

namespace pipetoml {

using testing::HasSubstr;

class ValueToTOMLTest : public LibValueTest
{
protected:
    toml_value convertBelowRoot(const Value & v)
    {
        return printValueAsTOML(settings, v);
    }

    static toml_value doc(const std::string & text)
    {
        return parseEmbeddedTOML(text, nullptr);
    }
};

/* ----------------------------------------------------------------------------
 * Scalars
 * --------------------------------------------------------------------------*/

TEST_F(ValueToTOMLTest, Bool)
{
    ASSERT_EQ(convertBelowRoot(Value().mkBool(true)), toml_value(true));
}

TEST_F(ValueToTOMLTest, Int)
{
    ASSERT_THAT(convertBelowRoot(mkIntValue(-42)), IsTOMLIntEq(-42));
}

TEST_F(ValueToTOMLTest, IntLimits)
{
    ASSERT_THAT(
        convertBelowRoot(mkIntValue(std::numeric_limits<ValueInt>::max())),
        IsTOMLIntEq(std::numeric_limits<toml::integer>::max()));
    ASSERT_THAT(
        convertBelowRoot(mkIntValue(std::numeric_limits<ValueInt>::min())),
        IsTOMLIntEq(std::numeric_limits<toml::integer>::min()));
}

TEST_F(ValueToTOMLTest, Float)
{
    auto t = convertBelowRoot(Value().mkFloat(1.25));
    ASSERT_TRUE(t.is_floating());
    ASSERT_EQ(t.as_floating(), 1.25);
}

TEST_F(ValueToTOMLTest, String)
{
    ASSERT_THAT(convertBelowRoot(mkStringValue("foo\n\"bar\"")), IsTOMLStringEq("foo\n\"bar\""));
}

TEST_F(ValueToTOMLTest, FilesizeIsIntegerBytes)
{
    ASSERT_THAT(convertBelowRoot(Value().mkFilesize(4096)), IsTOMLIntEq(4096));
}

TEST_F(ValueToTOMLTest, DurationIsNanosecondString)
{
    ASSERT_THAT(convertBelowRoot(Value().mkDuration(1500000000)), IsTOMLStringEq("1500000000"));
    ASSERT_THAT(convertBelowRoot(Value().mkDuration(-3)), IsTOMLStringEq("-3"));
}

TEST_F(ValueToTOMLTest, DateIsString)
{
    ASSERT_THAT(
        convertBelowRoot(Value().mkDate(Date{.nanoseconds = 0, .offset = 0})),
        IsTOMLStringEq("1970-01-01 00:00:00 +00:00"));
}

TEST_F(ValueToTOMLTest, BinaryIsArrayOfBytes)
{
    auto t = convertBelowRoot(Value().mkBinary({0, 127, 255}));
    ASSERT_THAT(t, IsArray());
    ASSERT_EQ(t, doc("x = [0, 127, 255]").at("x"));
}

TEST_F(ValueToTOMLTest, EmptyBinary)
{
    auto t = convertBelowRoot(Value().mkBinary({}));
    ASSERT_THAT(t, IsArray());
    ASSERT_TRUE(t.as_array().empty());
}

TEST_F(ValueToTOMLTest, CellPath)
{
    auto t = convertBelowRoot(Value().mkCellPath(CellPath{.members = {"name", uint64_t(3), "size"}}));
    ASSERT_EQ(t, doc("x = [\"name\", 3, \"size\"]").at("x"));
}

TEST_F(ValueToTOMLTest, CellPathIndexOverflow)
{
    auto v = Value().mkCellPath(CellPath{.members = {std::numeric_limits<uint64_t>::max()}});
    ASSERT_THROW(convertBelowRoot(v), ConversionError);
}

/* ----------------------------------------------------------------------------
 * Values without a TOML counterpart
 * --------------------------------------------------------------------------*/

TEST_F(ValueToTOMLTest, Placeholders)
{
    ASSERT_THAT(convertBelowRoot(Value().mkRange(Range{.from = 1, .to = 5})), IsTOMLStringEq("<Range>"));
    ASSERT_THAT(convertBelowRoot(Value().mkBlock(12)), IsTOMLStringEq("<Block>"));
    ASSERT_THAT(convertBelowRoot(Value()), IsTOMLStringEq("<Nothing>"));
}

class OpaqueValue : public CustomValueBase
{
public:
    std::string showType() const override
    {
        return "an opaque value";
    }

    std::string typeOf() const override
    {
        return "opaque";
    }
};

TEST_F(ValueToTOMLTest, CustomValuePlaceholder)
{
    auto v = Value().mkCustom(std::make_shared<const OpaqueValue>());
    ASSERT_THAT(convertBelowRoot(v), IsTOMLStringEq("<Custom Value>"));
}

TEST_F(ValueToTOMLTest, StrictModeRejectsPlaceholders)
{
    settings.strict = true;

    ASSERT_THROW(convertBelowRoot(Value().mkRange(Range{.from = 1, .to = 5})), UnsupportedValueError);
    ASSERT_THROW(convertBelowRoot(Value().mkBlock(12)), UnsupportedValueError);
    ASSERT_THROW(convertBelowRoot(Value()), UnsupportedValueError);
    ASSERT_THROW(
        convertBelowRoot(Value().mkCustom(std::make_shared<const OpaqueValue>())), UnsupportedValueError);
}

TEST_F(ValueToTOMLTest, StrictModeNamesTheType)
{
    settings.strict = true;

    try {
        convertBelowRoot(mkRecordValue({{"r", Value().mkRange(Range{.from = 1, .to = 5})}}));
        FAIL() << "expected an UnsupportedValueError";
    } catch (UnsupportedValueError & e) {
        ASSERT_THAT(e, HasMessage("cannot convert a range to a TOML value in strict mode"));
    }
}

TEST_F(ValueToTOMLTest, StrictModeKeepsRepresentableValues)
{
    settings.strict = true;

    ASSERT_THAT(convertBelowRoot(Value().mkDuration(5)), IsTOMLStringEq("5"));
    ASSERT_THAT(convertBelowRoot(Value().mkFilesize(5)), IsTOMLIntEq(5));
}

/* ----------------------------------------------------------------------------
 * Errors
 * --------------------------------------------------------------------------*/

MakeError(UpstreamError, Error);

TEST_F(ValueToTOMLTest, ErrorValueIsRethrown)
{
    auto v = Value().mkError(std::make_exception_ptr(UpstreamError("column not found")));

    try {
        convertBelowRoot(v);
        FAIL() << "expected the upstream error";
    } catch (UpstreamError & e) {
        ASSERT_THAT(e, HasMessage("column not found"));
    }
}

TEST_F(ValueToTOMLTest, NestedErrorValueIsRethrown)
{
    auto v = mkRecordValue({
        {"a", mkIntValue(1)},
        {"b", mkListValue({mkIntValue(2), Value().mkError(std::make_exception_ptr(UpstreamError("late")))})},
    });

    ASSERT_THROW(convertBelowRoot(v), UpstreamError);
}

TEST_F(ValueToTOMLTest, EmptyErrorValue)
{
    ASSERT_THROW(convertBelowRoot(Value().mkError(nullptr)), ConversionError);
}

/* ----------------------------------------------------------------------------
 * Records and lists
 * --------------------------------------------------------------------------*/

TEST_F(ValueToTOMLTest, RecordKeepsColumnOrder)
{
    auto t = convertBelowRoot(mkRecordValue({
        {"zeta", mkIntValue(1)},
        {"alpha", mkStringValue("x")},
    }));

    ASSERT_THAT(t, IsTable());
    ASSERT_EQ(t, doc("zeta = 1\nalpha = \"x\"\n"));
    ASSERT_NE(t, doc("alpha = \"x\"\nzeta = 1\n"));
}

TEST_F(ValueToTOMLTest, EmptyRecord)
{
    auto t = convertBelowRoot(mkRecordValue({}));
    ASSERT_THAT(t, IsTable());
    ASSERT_TRUE(t.as_table().empty());
}

TEST_F(ValueToTOMLTest, ListOfScalars)
{
    auto t = convertBelowRoot(mkListValue({mkIntValue(1), mkIntValue(2)}));
    ASSERT_EQ(t, doc("x = [1, 2]").at("x"));
}

TEST_F(ValueToTOMLTest, NestedSingleRecordListIsUnwrapped)
{
    auto t = convertBelowRoot(mkRecordValue({
        {"server", mkListValue({mkRecordValue({{"port", mkIntValue(80)}})})},
    }));

    ASSERT_EQ(t, doc("[server]\nport = 80\n"));
}

TEST_F(ValueToTOMLTest, NestedListOfRecordsIsArrayOfTables)
{
    auto t = convertBelowRoot(mkRecordValue({
        {"server",
         mkListValue({
             mkRecordValue({{"port", mkIntValue(80)}}),
             mkRecordValue({{"port", mkIntValue(443)}}),
         })},
    }));

    ASSERT_EQ(t, doc("[[server]]\nport = 80\n[[server]]\nport = 443\n"));
}

/* ----------------------------------------------------------------------------
 * unwrapSingleTable
 * --------------------------------------------------------------------------*/

TEST_F(ValueToTOMLTest, isSingleTableArray)
{
    ASSERT_TRUE(isSingleTableArray(doc("x = [{a = 1}]").at("x")));
    ASSERT_FALSE(isSingleTableArray(doc("x = [{a = 1}, {a = 2}]").at("x")));
    ASSERT_FALSE(isSingleTableArray(doc("x = [1]").at("x")));
    ASSERT_FALSE(isSingleTableArray(doc("x = []").at("x")));
    ASSERT_FALSE(isSingleTableArray(doc("x = {a = 1}").at("x")));
}

TEST_F(ValueToTOMLTest, unwrapSingleTable)
{
    ASSERT_EQ(unwrapSingleTable(doc("x = [{a = 1}]").at("x")), doc("a = 1"));

    auto two = doc("x = [{a = 1}, {a = 2}]").at("x");
    ASSERT_EQ(unwrapSingleTable(two), two);

    auto scalar = toml_value(3);
    ASSERT_EQ(unwrapSingleTable(scalar), scalar);
}

/* ----------------------------------------------------------------------------
 * Depth limit
 * --------------------------------------------------------------------------*/

TEST_F(ValueToTOMLTest, DepthWithinLimit)
{
    settings.maxDepth = 2;

    auto v = mkRecordValue({{"a", mkRecordValue({{"b", mkIntValue(1)}})}});
    ASSERT_NO_THROW(convertBelowRoot(v));
}

TEST_F(ValueToTOMLTest, DepthBeyondLimit)
{
    settings.maxDepth = 2;

    auto v = mkRecordValue({{"a", mkRecordValue({{"b", mkRecordValue({{"c", mkIntValue(1)}})}})}});
    try {
        convertBelowRoot(v);
        FAIL() << "expected a StackOverflowError";
    } catch (StackOverflowError & e) {
        ASSERT_THAT(e, HasMessage("a record is nested more than 2 levels deep"));
    }
}

TEST_F(ValueToTOMLTest, ListsCountTowardsDepth)
{
    settings.maxDepth = 2;

    auto v = mkListValue({mkListValue({mkListValue({mkIntValue(1)})})});
    ASSERT_THROW(convertBelowRoot(v), StackOverflowError);
}

TEST_F(ValueToTOMLTest, DeepValueWithDefaultLimit)
{
    Value v = mkIntValue(0);
    for (int i = 0; i < 200; ++i)
        v = mkListValue({v});

    ASSERT_NO_THROW(convertBelowRoot(v));
}

/* ----------------------------------------------------------------------------
 * Interruption
 * --------------------------------------------------------------------------*/

TEST_F(ValueToTOMLTest, Interrupted)
{
    interruptCheck = []() { return true; };

    ASSERT_THROW(convertBelowRoot(mkRecordValue({{"a", mkIntValue(1)}})), Interrupted);
}

/* ----------------------------------------------------------------------------
 * showDate
 * --------------------------------------------------------------------------*/

TEST_F(ValueToTOMLTest, showDateWithOffsetAndMilliseconds)
{
    ASSERT_EQ(
        showDate(Date{.nanoseconds = 1700000000123000000, .offset = 3600}), "2023-11-14 23:13:20.123 +01:00");
}

TEST_F(ValueToTOMLTest, showDateNegativeOffset)
{
    ASSERT_EQ(showDate(Date{.nanoseconds = 0, .offset = -19800}), "1969-12-31 18:30:00 -05:30");
}

TEST_F(ValueToTOMLTest, showDateFractions)
{
    ASSERT_EQ(showDate(Date{.nanoseconds = 1000}), "1970-01-01 00:00:00.000001 +00:00");
    ASSERT_EQ(showDate(Date{.nanoseconds = 7}), "1970-01-01 00:00:00.000000007 +00:00");
}

TEST_F(ValueToTOMLTest, showDateOffsetWithSeconds)
{
    ASSERT_EQ(showDate(Date{.nanoseconds = 0, .offset = 3661}), "1970-01-01 01:01:01 +01:01:01");
}

TEST_F(ValueToTOMLTest, showDateBeforeEpoch)
{
    ASSERT_EQ(showDate(Date{.nanoseconds = -1000000000}), "1969-12-31 23:59:59 +00:00");
}

TEST_F(ValueToTOMLTest, showDateAtTheLimits)
{
    constexpr auto maxNs = std::numeric_limits<int64_t>::max();
    constexpr auto minNs = std::numeric_limits<int64_t>::min();

    ASSERT_EQ(showDate(Date{.nanoseconds = maxNs, .offset = 3600}), "2262-04-12 00:47:16.854775807 +01:00");
    ASSERT_EQ(showDate(Date{.nanoseconds = minNs, .offset = -3600}), "1677-09-20 23:12:43.145224192 -01:00");
}

TEST_F(ValueToTOMLTest, showDateExtremeOffsets)
{
    constexpr auto maxOffset = std::numeric_limits<int32_t>::max();
    constexpr auto minOffset = std::numeric_limits<int32_t>::min();

    ASSERT_EQ(
        showDate(Date{.nanoseconds = std::numeric_limits<int64_t>::max(), .offset = maxOffset}),
        "2330-05-01 03:01:23.854775807 +596523:14:07");
    ASSERT_EQ(showDate(Date{.nanoseconds = 0, .offset = minOffset}), "1901-12-13 20:45:52 -596523:14:08");
}

} // namespace pipetoml
