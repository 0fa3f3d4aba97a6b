#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "pipetoml/value/to-toml.hh"
#include "pipetoml/value/tests/libvalue.hh"
#include "pipetoml/value/tests/value.hh"

#include <sstream>

namespace pipetoml {

using testing::HasSubstr;
using testing::Not;

class ToTOMLTest : public LibValueTest
{};

MakeError(UpstreamError, Error);

static Value mkErrorValue(std::string msg)
{
    return Value().mkError(std::make_exception_ptr(UpstreamError(msg)));
}

/* ----------------------------------------------------------------------------
 * Accepted roots
 * --------------------------------------------------------------------------*/

TEST_F(ToTOMLTest, RecordRoot)
{
    ASSERT_EQ(
        toText(mkRecordValue({
            {"a", mkIntValue(1)},
            {"b", mkStringValue("x")},
        })),
        "a = 1\nb = \"x\"\n");
}

TEST_F(ToTOMLTest, EmptyRecordRoot)
{
    ASSERT_EQ(toText(mkRecordValue({})), "");
}

TEST_F(ToTOMLTest, RecordKeysKeepTheirOrder)
{
    auto t = convert(mkRecordValue({
        {"zeta", mkIntValue(1)},
        {"alpha", mkIntValue(2)},
        {"mid", mkIntValue(3)},
    }));

    std::vector<std::string> keys;
    for (auto & [key, v] : t.as_table())
        keys.push_back(key);
    ASSERT_EQ(keys, (std::vector<std::string>{"zeta", "alpha", "mid"}));
}

TEST_F(ToTOMLTest, SingleRecordListIsTheSameAsTheRecord)
{
    auto record = mkRecordValue({{"a", mkIntValue(1)}});

    ASSERT_EQ(toText(mkListValue({record})), toText(record));
    ASSERT_THAT(convert(mkListValue({record})), IsTable());
}

TEST_F(ToTOMLTest, TwoRecordListIsArrayOfTables)
{
    auto list = mkListValue({
        mkRecordValue({{"a", mkIntValue(1)}}),
        mkRecordValue({{"b", mkIntValue(2)}}),
    });

    auto t = convert(list);
    ASSERT_THAT(t, IsArray());
    ASSERT_EQ(t.as_array().size(), 2u);
    ASSERT_THAT(t.as_array()[0], IsTable());

    auto text = toText(list);
    ASSERT_THAT(text, HasSubstr("a = 1"));
    ASSERT_THAT(text, HasSubstr("b = 2"));
    ASSERT_NE(text, toText(mkRecordValue({{"a", mkIntValue(1)}})));
}

TEST_F(ToTOMLTest, TwoRecordListReadsBackAsArray)
{
    auto list = mkListValue({
        mkRecordValue({{"a", mkIntValue(1)}}),
        mkRecordValue({{"b", mkStringValue("x")}}),
    });

    auto back = parseEmbeddedTOML(toText(list), nullptr);

    ASSERT_THAT(back, IsArray());
    ASSERT_EQ(back.as_array().size(), 2u);
    ASSERT_TRUE(sameDocument(back, convert(list)));
}

TEST_F(ToTOMLTest, BinaryFieldIsArray)
{
    auto t = convert(mkRecordValue({{"bytes", Value().mkBinary({1, 2, 3})}}));

    ASSERT_EQ(t, parseEmbeddedTOML("bytes = [1, 2, 3]", nullptr));
}

TEST_F(ToTOMLTest, PlaceholderFields)
{
    auto text = toText(mkRecordValue({
        {"r", Value().mkRange(Range{.from = 0, .to = 3})},
        {"n", Value()},
    }));

    ASSERT_EQ(text, "r = \"<Range>\"\nn = \"<Nothing>\"\n");
}

/* ----------------------------------------------------------------------------
 * String roots
 * --------------------------------------------------------------------------*/

TEST_F(ToTOMLTest, StringRootIsParsed)
{
    ASSERT_EQ(convert(mkStringValue("title = \"x\"")), convert(mkRecordValue({{"title", mkStringValue("x")}})));
}

TEST_F(ToTOMLTest, StringRootIsReformatted)
{
    ASSERT_EQ(toText(mkStringValue("  a   =   1 # comment\n")), "a = 1\n");
}

TEST_F(ToTOMLTest, StringRootWithRootArrayOfTables)
{
    auto t = convert(mkStringValue("[[\"\"]]\na = 1\n[[\"\"]]\nb = 2\n"));

    ASSERT_THAT(t, IsArray());
    ASSERT_EQ(t.as_array().size(), 2u);
    ASSERT_THAT(t.as_array()[0].at("a"), IsTOMLIntEq(1));
    ASSERT_THAT(t.as_array()[1].at("b"), IsTOMLIntEq(2));
}

TEST_F(ToTOMLTest, EmptyKeyWithOtherKeysStaysATable)
{
    auto t = convert(mkStringValue("x = 1\n[[\"\"]]\na = 1\n"));

    ASSERT_THAT(t, IsTable());
    ASSERT_EQ(t.as_table().size(), 2u);
}

TEST_F(ToTOMLTest, InvalidStringRoot)
{
    ASSERT_THROW(convert(mkStringValue("not valid")), EmbeddedParseError);
}

TEST_F(ToTOMLTest, InvalidStringRootMessage)
{
    auto source = std::make_shared<const std::string>("\"a = \"");
    auto v = mkStringValue("a = ");
    v.setPos(std::make_shared<const Pos>(1, 1, Pos::Stdin{.source = source}));

    try {
        convert(v);
        FAIL() << "expected an EmbeddedParseError";
    } catch (EmbeddedParseError & e) {
        ASSERT_THAT(e, HasMessage("while parsing TOML: "));
        ASSERT_THAT(e, HasMessage("at «stdin»:1:1:"));
    }
}

TEST_F(ToTOMLTest, EmbeddedParseErrorIsNotAShapeError)
{
    try {
        convert(mkStringValue("[broken"));
        FAIL() << "expected an EmbeddedParseError";
    } catch (ShapeError &) {
        FAIL() << "a malformed document is not a shape mismatch";
    } catch (EmbeddedParseError &) {
    }
}

/* ----------------------------------------------------------------------------
 * Rejected roots
 * --------------------------------------------------------------------------*/

TEST_F(ToTOMLTest, IntRoot)
{
    try {
        convert(mkIntValue(42));
        FAIL() << "expected a ShapeError";
    } catch (ShapeError & e) {
        ASSERT_THAT(
            e, HasMessage("expected a record or a list of records with TOML-compatible structure, but got an integer"));
    }
}

TEST_F(ToTOMLTest, ScalarRoots)
{
    ASSERT_THROW(convert(Value().mkBool(true)), ShapeError);
    ASSERT_THROW(convert(Value().mkFloat(1.5)), ShapeError);
    ASSERT_THROW(convert(Value().mkBinary({1})), ShapeError);
    ASSERT_THROW(convert(Value().mkDuration(1)), ShapeError);
    ASSERT_THROW(convert(Value().mkFilesize(1)), ShapeError);
    ASSERT_THROW(convert(Value().mkDate(Date{.nanoseconds = 0})), ShapeError);
    ASSERT_THROW(convert(Value().mkCellPath(CellPath{})), ShapeError);
}

TEST_F(ToTOMLTest, UnrepresentableRootsAreShapeErrors)
{
    ASSERT_THROW(convert(Value()), ShapeError);
    ASSERT_THROW(convert(Value().mkRange(Range{.from = 0, .to = 1})), ShapeError);
    ASSERT_THROW(convert(Value().mkBlock(1)), ShapeError);

    settings.strict = true;
    ASSERT_THROW(convert(Value()), ShapeError);
}

TEST_F(ToTOMLTest, ListOfScalarsRoot)
{
    try {
        convert(mkListValue({mkIntValue(1), mkIntValue(2), mkIntValue(3)}));
        FAIL() << "expected a ShapeError";
    } catch (ShapeError & e) {
        ASSERT_THAT(e, HasMessage("but got a list whose element 0 is an integer"));
    }
}

TEST_F(ToTOMLTest, MixedListRoot)
{
    try {
        convert(mkListValue({mkRecordValue({{"a", mkIntValue(1)}}), mkStringValue("x")}));
        FAIL() << "expected a ShapeError";
    } catch (ShapeError & e) {
        ASSERT_THAT(e, HasMessage("whose element 1 is a string"));
    }
}

TEST_F(ToTOMLTest, EmptyListRoot)
{
    try {
        convert(mkListValue({}));
        FAIL() << "expected a ShapeError";
    } catch (ShapeError & e) {
        ASSERT_THAT(e, HasMessage("but got a list that is empty"));
    }
}

TEST_F(ToTOMLTest, ShapeErrorCarriesRootPosition)
{
    auto source = std::make_shared<const std::string>("42\n");
    auto v = mkIntValue(42);
    v.setPos(std::make_shared<const Pos>(1, 1, Pos::Stdin{.source = source}));

    try {
        convert(v);
        FAIL() << "expected a ShapeError";
    } catch (ShapeError & e) {
        ASSERT_NE(e.info().pos, nullptr);
        ASSERT_EQ(e.info().pos->line, 1u);
        ASSERT_THAT(e, HasMessage("at «stdin»:1:1:"));
    }
}

TEST_F(ToTOMLTest, NoOutputOnFailure)
{
    std::ostringstream out;
    ASSERT_THROW(toTOML(settings, mkIntValue(1), out), ShapeError);
    ASSERT_EQ(out.str(), "");
}

/* ----------------------------------------------------------------------------
 * Error values
 * --------------------------------------------------------------------------*/

TEST_F(ToTOMLTest, ErrorRootIsPropagatedUnchanged)
{
    try {
        convert(mkErrorValue("upstream failed"));
        FAIL() << "expected the upstream error";
    } catch (UpstreamError & e) {
        ASSERT_EQ(filterANSIEscapes(e.what()), "error: upstream failed");
    }
}

TEST_F(ToTOMLTest, NestedErrorIsPropagatedUnchanged)
{
    auto v = mkRecordValue({
        {"a", mkIntValue(1)},
        {"b", mkRecordValue({{"c", mkErrorValue("deep failure")}})},
    });

    try {
        convert(v);
        FAIL() << "expected the upstream error";
    } catch (UpstreamError & e) {
        ASSERT_EQ(filterANSIEscapes(e.what()), "error: deep failure");
    }
}

TEST_F(ToTOMLTest, FirstErrorInDocumentOrderWins)
{
    auto v = mkRecordValue({
        {"a", mkErrorValue("first")},
        {"b", mkErrorValue("second")},
    });

    try {
        convert(v);
        FAIL() << "expected the upstream error";
    } catch (UpstreamError & e) {
        ASSERT_THAT(e, HasMessage("first"));
        ASSERT_THAT(e, Not(HasMessage("second")));
    }
}

TEST_F(ToTOMLTest, ErrorElementOfRootListIsPropagated)
{
    auto v = mkListValue({
        mkRecordValue({{"a", mkIntValue(1)}}),
        mkErrorValue("bad row"),
        mkIntValue(3),
    });

    ASSERT_THROW(convert(v), UpstreamError);
}

TEST_F(ToTOMLTest, ShapeMismatchBeforeErrorElement)
{
    auto v = mkListValue({mkIntValue(1), mkErrorValue("bad row")});

    ASSERT_THROW(convert(v), ShapeError);
}

/* ----------------------------------------------------------------------------
 * Cancellation
 * --------------------------------------------------------------------------*/

TEST_F(ToTOMLTest, InterruptedBetweenRows)
{
    int calls = 0;
    interruptCheck = [&]() { return ++calls > 3; };

    auto v = mkListValue({
        mkRecordValue({{"a", mkIntValue(1)}}),
        mkRecordValue({{"a", mkIntValue(2)}}),
        mkRecordValue({{"a", mkIntValue(3)}}),
    });

    std::ostringstream out;
    ASSERT_THROW(toTOML(settings, v, out), Interrupted);
    ASSERT_EQ(out.str(), "");
}

/* ----------------------------------------------------------------------------
 * Properties
 * --------------------------------------------------------------------------*/

RC_GTEST_FIXTURE_PROP(ToTOMLTest, prop_round_trip, ())
{
    auto v = *rc::genTOMLSerializableRecord();

    auto tree = convert(v);
    auto back = parseEmbeddedTOML(toText(v), nullptr);

    RC_ASSERT(sameDocument(tree, back));
}

RC_GTEST_FIXTURE_PROP(ToTOMLTest, prop_reconvert_output, ())
{
    auto v = *rc::genTOMLSerializableRecord();

    auto text = toText(v);

    RC_ASSERT(sameDocument(convert(mkStringValue(text)), convert(v)));
}

RC_GTEST_FIXTURE_PROP(ToTOMLTest, prop_round_trip_record_list, ())
{
    auto v = *rc::genTOMLSerializableRecordList();

    auto tree = convert(v);
    auto back = parseEmbeddedTOML(toText(v), nullptr);

    RC_ASSERT(back.is_array());
    RC_ASSERT(sameDocument(tree, back));
}

RC_GTEST_FIXTURE_PROP(ToTOMLTest, prop_reconvert_record_list_output, ())
{
    auto v = *rc::genTOMLSerializableRecordList();

    RC_ASSERT(sameDocument(convert(mkStringValue(toText(v))), convert(v)));
}

static bool isContainer(const Value & v)
{
    return v.type() == nRecord || v.type() == nList;
}

RC_GTEST_FIXTURE_PROP(ToTOMLTest, prop_flat_records_at_depth_zero, ())
{
    auto v = *rc::genTOMLSerializableRecord(0);

    RC_ASSERT(v.type() == nRecord);
    for (auto & field : v.record().vals)
        RC_ASSERT(!isContainer(field));
}

RC_GTEST_FIXTURE_PROP(ToTOMLTest, prop_flat_record_list_at_depth_one, ())
{
    auto v = *rc::genTOMLSerializableRecordList(1);

    RC_ASSERT(v.listItems().size() >= 2u);
    RC_ASSERT(v.listItems().size() <= 4u);
    for (auto & record : v.listItems())
        for (auto & field : record.record().vals)
            RC_ASSERT(!isContainer(field));
}

RC_GTEST_FIXTURE_PROP(ToTOMLTest, prop_single_table_unwrap, ())
{
    auto v = *rc::genTOMLSerializableRecord();

    RC_ASSERT(toText(mkListValue({v})) == toText(v));
}

} // namespace pipetoml
