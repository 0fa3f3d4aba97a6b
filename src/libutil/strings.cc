#include "pipetoml/util/strings.hh"

#include <boost/lexical_cast.hpp>

#include <limits>

namespace pipetoml {

static constexpr std::string_view whitespace = " \t\r\n";

std::string chomp(std::string_view s)
{
    auto end = s.find_last_not_of(whitespace);
    return end == s.npos ? "" : std::string(s.substr(0, end + 1));
}

std::string trim(std::string_view s)
{
    auto start = s.find_first_not_of(whitespace);
    if (start == s.npos)
        return "";
    return chomp(s.substr(start));
}

template<class N>
std::optional<N> string2Int(std::string_view s)
{
    /* lexical_cast wraps negative numbers into unsigned types. */
    if (!std::numeric_limits<N>::is_signed && !s.empty() && s[0] == '-')
        return std::nullopt;
    try {
        return boost::lexical_cast<N>(s.data(), s.size());
    } catch (const boost::bad_lexical_cast &) {
        return std::nullopt;
    }
}

template std::optional<int> string2Int<int>(std::string_view s);
template std::optional<unsigned int> string2Int<unsigned int>(std::string_view s);
template std::optional<long> string2Int<long>(std::string_view s);

std::string_view baseNameOf(std::string_view path)
{
    auto end = path.find_last_not_of('/');
    if (end == path.npos)
        return path.empty() ? path : path.substr(0, 1);
    path = path.substr(0, end + 1);
    auto slash = path.rfind('/');
    return slash == path.npos ? path : path.substr(slash + 1);
}

} // namespace pipetoml
