#pragma once
///@file

#include <rapidcheck/gen/Arbitrary.h>

#include "pipetoml/value/value.hh"

namespace rc {
using namespace pipetoml;

/**
 * Generate values that convert to TOML without error and without
 * losing information on the way back, nested at most `depth` lists
 * and records deep.
 */
Gen<Value> genTOMLSerializableValue(unsigned int depth = 3);

/**
 * Like `genTOMLSerializableValue()`, but always a record. A record is
 * at least one level deep, so `depth` 0 behaves like 1.
 */
Gen<Value> genTOMLSerializableRecord(unsigned int depth = 3);

/**
 * A list of two to four records, which converts to an array of tables
 * at the root of a document.
 */
Gen<Value> genTOMLSerializableRecordList(unsigned int depth = 3);

} // namespace rc
