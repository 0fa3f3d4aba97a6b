#include "pipetoml/util/logging.hh"
#include "pipetoml/util/file-descriptor.hh"
#include "pipetoml/util/terminal.hh"

#include <sstream>

namespace pipetoml {

Verbosity verbosity = lvlInfo;

class SimpleLogger : public Logger
{
    bool colour = shouldANSI();

public:
    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl > verbosity)
            return;
        writeToStderr((colour ? std::string(s) : filterANSIEscapes(s)) + "\n");
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream out;
        showErrorInfo(out, ei);
        log(ei.level, out.str());
    }
};

std::unique_ptr<Logger> makeSimpleLogger()
{
    return std::make_unique<SimpleLogger>();
}

std::unique_ptr<Logger> logger = makeSimpleLogger();

void writeToStderr(std::string_view s)
{
    try {
        writeFull(getStandardError(), s, false);
    } catch (SysError &) {
        /* Nowhere left to report it. */
    }
}

} // namespace pipetoml
