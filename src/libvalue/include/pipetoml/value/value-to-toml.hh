#pragma once
///@file

#include "pipetoml/util/configuration.hh"
#include "pipetoml/util/error.hh"
#include "pipetoml/value/value.hh"

#include <toml.hpp>

#include <string>
#include <vector>

namespace pipetoml {

/**
 * A TOML value whose tables keep their keys in insertion order.
 */
using toml_value = toml::basic_value<toml::discard_comments, toml::ordered_map, std::vector>;

struct TOMLSettings : Config
{
    Setting<bool> strict{
        this,
        false,
        "strict",
        R"(
          Whether values that have no TOML counterpart (ranges, blocks,
          nothing and custom values) cause an error. When disabled, they
          are written as placeholder strings such as `"<Nothing>"`.
        )"};

    Setting<unsigned int> maxDepth{
        this,
        10000,
        "max-depth",
        R"(
          The maximum number of nested lists and records in a converted
          value.
        )"};

    Setting<unsigned int> lineWidth{
        this,
        80,
        "line-width",
        R"(
          The line width beyond which arrays and inline tables are
          broken over several lines.
        )"};

    Setting<int> floatPrecision{
        this,
        17,
        "float-precision",
        R"(
          The number of significant digits written for floating point
          numbers. The default is enough to read back the same number.
        )"};
};

extern TOMLSettings tomlSettings;

MakeError(ConversionError, Error);
/**
 * The root value cannot be the root of a TOML document.
 */
MakeError(ShapeError, ConversionError);
MakeError(EmbeddedParseError, ConversionError);
MakeError(UnsupportedValueError, ConversionError);
MakeError(StackOverflowError, ConversionError);

/**
 * Convert a value below the document root to a TOML value.
 *
 * Error values are rethrown as they are.
 *
 * @param depth The number of lists and records enclosing `v`.
 */
toml_value printValueAsTOML(const TOMLSettings & settings, const Value & v, unsigned int depth = 0);

toml_value recordToTOML(const TOMLSettings & settings, const Record & record, unsigned int depth);

/**
 * Convert the elements of a list in order, then apply
 * `unwrapSingleTable()` to the result.
 */
toml_value listToTOML(const TOMLSettings & settings, const ValueList & elems, unsigned int depth);

/**
 * Whether `v` is an array holding exactly one table.
 */
bool isSingleTableArray(const toml_value & v);

/**
 * Replace an array holding exactly one table by that table. Any other
 * value, including an array of two or more tables, is returned as is.
 */
toml_value unwrapSingleTable(toml_value v);

/**
 * Render a date as `YYYY-MM-DD HH:MM:SS[.fraction] +HH:MM` in its own
 * UTC offset.
 */
std::string showDate(const Date & d);

} // namespace pipetoml
