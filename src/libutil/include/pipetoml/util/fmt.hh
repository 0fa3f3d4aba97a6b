#pragma once
///@file

#include <boost/format.hpp>

#include <ostream>
#include <string>
#include <string_view>

#include "pipetoml/util/ansicolor.hh"

namespace pipetoml {

/**
 * Make a `boost::format` tolerate a format string that has more or
 * fewer placeholders than there are arguments.
 */
inline void relaxArgCount(boost::format & f)
{
    f.exceptions(boost::io::all_error_bits ^ boost::io::too_many_args_bit ^ boost::io::too_few_args_bit);
}

/**
 * A lone argument is returned unchanged, so that a message containing
 * `%` is never read as a format string.
 */
inline std::string fmt(std::string_view s)
{
    return std::string(s);
}

/**
 * `boost::format` the arguments into a string:
 *
 *   fmt("%1% is %2%", "x", 3) == "x is 3"
 */
template<typename T, typename... Args>
std::string fmt(const std::string & fs, const T & first, const Args &... rest)
{
    boost::format f(fs);
    relaxArgCount(f);
    ((f % first) % ... % rest);
    return f.str();
}

template<class T>
struct Magenta
{
    Magenta(const T & value)
        : value(value)
    {
    }

    const T & value;
};

template<class T>
std::ostream & operator<<(std::ostream & out, const Magenta<T> & m)
{
    return out << ANSI_MAGENTA << m.value << ANSI_NORMAL;
}

/**
 * Interpolate an argument of `HintFmt` without highlighting it.
 */
template<class T>
struct Uncolored
{
    Uncolored(const T & value)
        : value(value)
    {
    }

    const T & value;
};

/**
 * The message of an error. Interpolated arguments are highlighted in
 * magenta unless they are wrapped in `Uncolored`.
 */
class HintFmt
{
    boost::format f;

public:
    /**
     * A message taken literally.
     */
    HintFmt(const std::string & literal)
        : f("%s")
    {
        f % literal;
    }

    template<typename... Args>
    HintFmt(const std::string & format, const Args &... args)
        : f(format)
    {
        relaxArgCount(f);
        (*this % ... % args);
    }

    template<class T>
    HintFmt & operator%(const T & value)
    {
        f % Magenta<T>(value);
        return *this;
    }

    template<class T>
    HintFmt & operator%(const Uncolored<T> & value)
    {
        f % value.value;
        return *this;
    }

    std::string str() const
    {
        return f.str();
    }
};

std::ostream & operator<<(std::ostream & out, const HintFmt & hf);

} // namespace pipetoml
