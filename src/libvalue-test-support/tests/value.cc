#include <exception> // Needed by rapidcheck on Darwin
#include <rapidcheck.h>

#include "pipetoml/value/tests/value.hh"

namespace rc {
using namespace pipetoml;

/* Strings and keys are kept short so that the emitted text never
   needs to be folded over several lines. */

static Gen<std::string> genBareKey()
{
    return gen::resize(
        10,
        gen::nonEmpty(gen::container<std::string>(
            gen::elementOf(std::string("ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789_-")))));
}

static Gen<std::string> genShortString()
{
    return gen::resize(
        20,
        gen::container<std::string>(gen::elementOf(
            std::string("ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789 _-.,:;'!?#$%&()*+/<=>@[]^`{|}~\\"))));
}

static Gen<Value> genScalar()
{
    return gen::oneOf(
        // nInt
        gen::apply([](ValueInt val) { return Value().mkInt(val); }, gen::arbitrary<ValueInt>()),
        // nFloat, with few enough significant digits to be printed exactly
        gen::apply([](int32_t val) { return Value().mkFloat(val / 64.0); }, gen::arbitrary<int32_t>()),
        // nBool
        gen::apply([](bool val) { return Value().mkBool(val); }, gen::arbitrary<bool>()),
        // nString
        gen::apply([](std::string val) { return Value().mkString(std::move(val)); }, genShortString()),
        // nFilesize
        gen::apply([](int64_t val) { return Value().mkFilesize(val); }, gen::arbitrary<int64_t>()),
        // nDuration
        gen::apply([](int64_t val) { return Value().mkDuration(val); }, gen::arbitrary<int64_t>()),
        // nBinary
        gen::apply(
            [](std::vector<uint8_t> val) { return Value().mkBinary(std::move(val)); },
            gen::resize(20, gen::arbitrary<std::vector<uint8_t>>())),
        // nNothing
        gen::just(Value()));
}

Gen<Value> genTOMLSerializableRecord(unsigned int depth)
{
    /* A record is one level itself, so a depth of 0 is treated as 1. */
    auto fieldDepth = depth > 0 ? depth - 1 : 0;

    return gen::exec([fieldDepth]() {
        Record record;
        int size = *gen::inRange(0, 8);
        for (auto i = 0; i < size; i++)
            record.insert(*genBareKey(), *genTOMLSerializableValue(fieldDepth));
        return Value().mkRecord(std::move(record));
    });
}

Gen<Value> genTOMLSerializableRecordList(unsigned int depth)
{
    auto recordDepth = depth > 1 ? depth - 1 : 1;

    return gen::exec([recordDepth]() {
        ValueList elems;
        int size = *gen::inRange(2, 5);
        for (auto i = 0; i < size; i++)
            elems.push_back(*genTOMLSerializableRecord(recordDepth));
        return Value().mkList(std::move(elems));
    });
}

Gen<Value> genTOMLSerializableValue(unsigned int depth)
{
    if (depth == 0)
        return genScalar();

    auto listOfInts = gen::exec([]() {
        ValueList elems;
        int size = *gen::inRange(0, 5);
        for (auto i = 0; i < size; i++)
            elems.push_back(Value().mkInt(*gen::arbitrary<ValueInt>()));
        return Value().mkList(std::move(elems));
    });

    /* A list of records needs one level for the list and one for the
       records. */
    if (depth == 1)
        return gen::oneOf(genScalar(), genTOMLSerializableRecord(depth), listOfInts);

    return gen::oneOf(
        genScalar(),
        genTOMLSerializableRecord(depth),
        listOfInts,
        // nList of records
        gen::exec([depth]() {
            ValueList elems;
            int size = *gen::inRange(1, 4);
            for (auto i = 0; i < size; i++)
                elems.push_back(*genTOMLSerializableRecord(depth - 1));
            return Value().mkList(std::move(elems));
        }));
}

} // namespace rc
