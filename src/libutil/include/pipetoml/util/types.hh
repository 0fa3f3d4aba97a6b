#pragma once
///@file

#include <list>
#include <map>
#include <string>

namespace pipetoml {

typedef std::list<std::string> Strings;

typedef std::map<std::string, std::string> StringMap;

/**
 * Combine lambdas into one visitor for `std::visit`.
 */
template<class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};

template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace pipetoml
