#pragma once
///@file

#include "pipetoml/util/error.hh"
#include "pipetoml/util/position.hh"
#include "pipetoml/value/value.hh"
#include "pipetoml/value/value-to-toml.hh"

#include <string_view>

namespace pipetoml {

MakeError(JSONParseError, Error);

/**
 * Parse JSON text into `v`. Objects become records that keep the key
 * order of the text, `null` becomes nothing, and integers too large
 * for a signed 64-bit integer become floats.
 *
 * @param origin Where `s` came from. The root value is positioned at
 * the start of it.
 *
 * @param maxDepth Arrays and objects nested deeper than this are a
 * `StackOverflowError`, raised before the nested value is built.
 */
void parseJSON(
    std::string_view s,
    Value & v,
    Pos::Origin origin = std::monostate(),
    unsigned int maxDepth = tomlSettings.maxDepth);

} // namespace pipetoml
