#pragma once
///@file

#include <optional>
#include <string>
#include <string_view>

namespace pipetoml {

/**
 * Remove trailing whitespace.
 */
std::string chomp(std::string_view s);

/**
 * Remove leading and trailing whitespace.
 */
std::string trim(std::string_view s);

/**
 * Parse a whole string as a decimal integer of type `N`. Returns
 * nothing on garbage, overflow, or a minus sign for an unsigned `N`.
 */
template<class N>
std::optional<N> string2Int(std::string_view s);

/**
 * Everything after the last `/`, ignoring trailing slashes.
 */
std::string_view baseNameOf(std::string_view path);

} // namespace pipetoml
