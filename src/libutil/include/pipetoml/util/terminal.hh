#pragma once
///@file

#include <string>
#include <string_view>

namespace pipetoml {

/**
 * Whether colour escapes should be written to stderr. `NO_COLOR`
 * turns them off and `FORCE_COLOR` on. Otherwise they are used when
 * stderr is a terminal other than a dumb one.
 */
bool shouldANSI();

/**
 * Remove ANSI escape sequences, including the colour codes produced
 * by `HintFmt`.
 */
std::string filterANSIEscapes(std::string_view s);

} // namespace pipetoml
