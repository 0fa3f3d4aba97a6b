#pragma once
/**
 * @file
 *
 * Exceptions carry an `ErrorInfo`: a level, a message and optionally
 * the source position the error is about. The text is rendered by
 * `showErrorInfo()` when it is needed, not when the error is thrown.
 */

#include "pipetoml/util/fmt.hh"

#include <cerrno>
#include <cstring>
#include <memory>
#include <optional>
#include <source_location>

namespace pipetoml {

enum Verbosity { lvlError = 0, lvlWarn, lvlNotice, lvlInfo, lvlDebug };

struct Pos;

struct ErrorInfo
{
    Verbosity level;
    HintFmt msg;
    std::shared_ptr<const Pos> pos;
};

/**
 * Write `level: message`, followed by the position and the lines of
 * code around it if they are known. Lines after the first are indented
 * to line up with the message.
 */
std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo);

/**
 * The root of all pipetoml exceptions. Catch `Error` instead, which
 * leaves out `Interrupted`.
 */
class BaseError : public std::exception
{
protected:
    ErrorInfo err;

    mutable std::optional<std::string> what_;

    const std::string & calcWhat() const;

public:
    template<typename... Args>
    explicit BaseError(const std::string & fs, const Args &... args)
        : err{.level = lvlError, .msg = HintFmt(fs, args...)}
    {
    }

    BaseError(HintFmt msg)
        : err{.level = lvlError, .msg = std::move(msg)}
    {
    }

    /**
     * The message alone, without the `error:` prefix or the position.
     */
    std::string message() const
    {
        return err.msg.str();
    }

    const char * what() const noexcept override
    {
        return calcWhat().c_str();
    }

    const std::string & msg() const
    {
        return calcWhat();
    }

    const ErrorInfo & info() const
    {
        return err;
    }

    void atPos(std::shared_ptr<const Pos> pos)
    {
        err.pos = std::move(pos);
        what_.reset();
    }
};

#define MakeError(newClass, superClass) \
    class newClass : public superClass  \
    {                                   \
    public:                             \
        using superClass::superClass;   \
    }

MakeError(Error, BaseError);
MakeError(UsageError, Error);

/**
 * A failed system call. The message is followed by `strerror(errNo)`.
 */
class SysError : public Error
{
public:
    int errNo;

    template<typename... Args>
    SysError(int errNo, const std::string & fs, const Args &... args)
        : Error("%1%: %2%", Uncolored(fmt(fs, args...)), Uncolored(std::string(strerror(errNo))))
        , errNo(errNo)
    {
    }

    /**
     * Uses the current `errno`, so nothing may modify it between the
     * failing call and this constructor.
     */
    template<typename... Args>
    SysError(const std::string & fs, const Args &... args)
        : SysError(errno, fs, args...)
    {
    }
};

/**
 * Thrown to leave `main()` early with the given exit status.
 */
class Exit : public std::exception
{
public:
    int status;

    explicit Exit(int status = 0)
        : status(status)
    {
    }
};

/**
 * Report a condition the code does not expect and terminate.
 */
[[noreturn]] void unreachable(std::source_location loc = std::source_location::current());

} // namespace pipetoml
