#pragma once
///@file

#include "pipetoml/util/error.hh"

#include <memory>
#include <string_view>

namespace pipetoml {

class Logger
{
public:
    virtual ~Logger() {}

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    /**
     * Log an error, a warning or a note in the format of
     * `showErrorInfo()`.
     */
    virtual void logEI(const ErrorInfo & ei) = 0;

    void warn(const std::string & msg)
    {
        log(lvlWarn, ANSI_MAGENTA "warning:" ANSI_NORMAL " " + msg);
    }
};

/**
 * A logger that writes each message as a line on stderr. Colour codes
 * are removed unless `shouldANSI()` holds.
 */
std::unique_ptr<Logger> makeSimpleLogger();

extern std::unique_ptr<Logger> logger;

/**
 * Messages above this level are dropped.
 */
extern Verbosity verbosity;

/* Macros, so that the arguments are not formatted for messages that
   are dropped anyway. */

#define printMsg(level, args...)                              \
    do {                                                      \
        auto lvl_ = (level);                                  \
        if (lvl_ <= pipetoml::verbosity)                      \
            pipetoml::logger->log(lvl_, pipetoml::fmt(args)); \
    } while (0)

#define printError(args...) printMsg(pipetoml::lvlError, args)
#define printInfo(args...) printMsg(pipetoml::lvlInfo, args)
#define debug(args...) printMsg(pipetoml::lvlDebug, args)

template<typename... Args>
void warn(const std::string & fs, const Args &... args)
{
    if (verbosity >= lvlWarn)
        logger->warn(fmt(fs, args...));
}

/**
 * Write to stderr, ignoring failures.
 */
void writeToStderr(std::string_view s);

} // namespace pipetoml
