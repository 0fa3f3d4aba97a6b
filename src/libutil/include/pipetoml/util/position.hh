#pragma once
///@file

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pipetoml {

/**
 * The line containing an error and, where they exist, its neighbours.
 */
struct LinesOfCode
{
    std::optional<std::string> prevLineOfCode;
    std::optional<std::string> errLineOfCode;
    std::optional<std::string> nextLineOfCode;
};

/**
 * A 1-based line and column in some input text. A line of 0 means the
 * position is unknown, a column of 0 that only the line is.
 */
struct Pos
{
    uint32_t line = 0;
    uint32_t column = 0;

    /**
     * Text read from standard input.
     */
    struct Stdin
    {
        std::shared_ptr<const std::string> source;
    };

    /**
     * Text held in a string value.
     */
    struct String
    {
        std::shared_ptr<const std::string> source;
    };

    typedef std::variant<std::monostate, Stdin, String> Origin;

    Origin origin;

    Pos() {}

    Pos(uint32_t line, uint32_t column, Origin origin)
        : line(line)
        , column(column)
        , origin(std::move(origin))
    {
    }

    explicit operator bool() const
    {
        return line > 0;
    }

    /**
     * The text this position points into, if it was kept.
     */
    const std::string * getSource() const;

    std::optional<LinesOfCode> getCodeLines() const;
};

std::ostream & operator<<(std::ostream & out, const Pos & pos);

/**
 * Split text into lines. `\n`, `\r\n` and a lone `\r` all end a line.
 */
std::vector<std::string_view> splitLines(std::string_view s);

} // namespace pipetoml
