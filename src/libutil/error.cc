#include "pipetoml/util/error.hh"
#include "pipetoml/util/logging.hh"
#include "pipetoml/util/position.hh"
#include "pipetoml/util/strings.hh"
#include "pipetoml/util/terminal.hh"

#include <exception>
#include <sstream>

namespace pipetoml {

std::ostream & operator<<(std::ostream & out, const HintFmt & hf)
{
    return out << hf.str();
}

const std::string & BaseError::calcWhat() const
{
    if (!what_) {
        std::ostringstream out;
        showErrorInfo(out, err);
        what_ = out.str();
    }
    return *what_;
}

static const char * levelPrefix(Verbosity level)
{
    switch (level) {
    case lvlError:
        return ANSI_RED "error:" ANSI_NORMAL " ";
    case lvlWarn:
        return ANSI_MAGENTA "warning:" ANSI_NORMAL " ";
    case lvlNotice:
        return ANSI_GREEN "note:" ANSI_NORMAL " ";
    case lvlInfo:
        return ANSI_GREEN "info:" ANSI_NORMAL " ";
    case lvlDebug:
        return ANSI_MAGENTA "debug:" ANSI_NORMAL " ";
    }
    unreachable();
}

/**
 * The source around `pos` in a gutter of line numbers, with a caret
 * under the column.
 */
static void printCodeLines(std::ostream & out, const Pos & pos, const LinesOfCode & loc)
{
    auto printLine = [&](uint32_t n, const std::optional<std::string> & text) {
        if (text)
            out << "\n" << fmt(" %|1$5d|| %2%", n, *text);
    };

    printLine(pos.line - 1, loc.prevLineOfCode);
    printLine(pos.line, loc.errLineOfCode);
    if (loc.errLineOfCode && pos.column > 0)
        out << "\n" << "      |" << std::string(pos.column, ' ') << ANSI_RED "^" ANSI_NORMAL;
    printLine(pos.line + 1, loc.nextLineOfCode);
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo)
{
    std::ostringstream body;
    body << einfo.msg;

    if (einfo.pos && *einfo.pos) {
        body << "\n" ANSI_BLUE "at " ANSI_MAGENTA << *einfo.pos << ANSI_NORMAL ":";
        if (auto loc = einfo.pos->getCodeLines())
            printCodeLines(body, *einfo.pos, *loc);
    }

    std::string prefix = levelPrefix(einfo.level);
    std::string margin(filterANSIEscapes(prefix).size(), ' ');

    auto text = body.str();
    bool first = true;
    for (auto line : splitLines(text)) {
        if (!first)
            out << "\n";
        out << chomp((first ? prefix : margin) + std::string(line));
        first = false;
    }

    return out;
}

void unreachable(std::source_location loc)
{
    writeToStderr(fmt("unexpected condition at %s:%d in %s\n", loc.file_name(), loc.line(), loc.function_name()));
    std::terminate();
}

} // namespace pipetoml
