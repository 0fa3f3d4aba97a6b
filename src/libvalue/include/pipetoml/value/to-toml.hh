#pragma once
///@file

#include "pipetoml/value/value-to-toml.hh"

#include <ostream>
#include <string>

namespace pipetoml {

/**
 * Convert the root of a pipeline to the root of a TOML document.
 *
 * A record becomes a table. A non-empty list of records becomes an
 * array of tables, or a single table if it has exactly one element. A
 * string is parsed as TOML text. Anything else is a `ShapeError`.
 */
toml_value printRootAsTOML(const TOMLSettings & settings, const Value & root);

/**
 * Parse a string holding a TOML document. A document whose only key
 * is the empty key, holding an array of tables, is the way
 * `printDocumentAsTOML()` writes an array of tables, and is returned
 * as that array.
 *
 * @param pos Position of the string, used when parsing fails.
 */
toml_value parseEmbeddedTOML(const std::string & s, std::shared_ptr<const Pos> pos);

std::string printDocumentAsTOML(const TOMLSettings & settings, const toml_value & doc);

/**
 * Convert `root` to TOML text. No output is produced when the
 * conversion fails.
 */
std::string toTOML(const TOMLSettings & settings, const Value & root);

void toTOML(const TOMLSettings & settings, const Value & root, std::ostream & str);

} // namespace pipetoml
