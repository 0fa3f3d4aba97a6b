#include "pipetoml/util/position.hh"
#include "pipetoml/util/types.hh"

namespace pipetoml {

const std::string * Pos::getSource() const
{
    return std::visit(
        overloaded{
            [](const std::monostate &) -> const std::string * { return nullptr; },
            [](const Stdin & s) -> const std::string * { return s.source.get(); },
            [](const String & s) -> const std::string * { return s.source.get(); },
        },
        origin);
}

std::optional<LinesOfCode> Pos::getCodeLines() const
{
    auto source = getSource();
    if (line == 0 || !source)
        return std::nullopt;

    auto lines = splitLines(*source);
    auto lineAt = [&](size_t n) -> std::optional<std::string> {
        if (n == 0 || n > lines.size())
            return std::nullopt;
        return std::string(lines[n - 1]);
    };

    return LinesOfCode{
        .prevLineOfCode = lineAt(line - 1),
        .errLineOfCode = lineAt(line),
        .nextLineOfCode = lineAt(line + 1),
    };
}

std::ostream & operator<<(std::ostream & out, const Pos & pos)
{
    std::visit(
        overloaded{
            [&](const std::monostate &) { out << "«none»"; },
            [&](const Pos::Stdin &) { out << "«stdin»"; },
            [&](const Pos::String &) { out << "«string»"; },
        },
        pos.origin);
    out << ":" << pos.line;
    if (pos.column > 0)
        out << ":" << pos.column;
    return out;
}

std::vector<std::string_view> splitLines(std::string_view s)
{
    std::vector<std::string_view> lines;
    while (!s.empty()) {
        auto eol = s.find_first_of("\r\n");
        lines.push_back(s.substr(0, eol));
        if (eol == s.npos)
            break;
        s.remove_prefix(s.compare(eol, 2, "\r\n") == 0 ? eol + 2 : eol + 1);
    }
    return lines;
}

} // namespace pipetoml
