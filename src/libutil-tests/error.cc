#include "pipetoml/util/error.hh"
#include "pipetoml/util/logging.hh"
#include "pipetoml/util/position.hh"
#include "pipetoml/util/terminal.hh"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <sstream>

namespace pipetoml {

using testing::HasSubstr;
using testing::Not;

static std::string showPlain(const ErrorInfo & ei)
{
    std::ostringstream out;
    showErrorInfo(out, ei);
    return filterANSIEscapes(out.str());
}

/* ----------------------------------------------------------------------------
 * BaseError
 * --------------------------------------------------------------------------*/

MakeError(TestError, Error);

TEST(BaseError, whatContainsFormattedMessage)
{
    TestError e("value is %1%", 42);

    ASSERT_EQ(filterANSIEscapes(e.message()), "value is 42");
    ASSERT_EQ(filterANSIEscapes(e.what()), "error: value is 42");
}

TEST(BaseError, singleArgumentIsNotAFormatString)
{
    TestError e("100% sure");

    ASSERT_EQ(e.message(), "100% sure");
}

TEST(BaseError, atPosResetsCachedWhat)
{
    auto source = std::make_shared<const std::string>("42\n");
    TestError e("bad value");
    ASSERT_THAT(std::string(e.what()), Not(HasSubstr("«string»")));

    e.atPos(std::make_shared<const Pos>(1, 1, Pos::String{.source = source}));
    ASSERT_THAT(filterANSIEscapes(e.what()), HasSubstr("at «string»:1:1:"));
}

TEST(BaseError, subclassesCanBeCaughtAsError)
{
    ASSERT_THROW(throw TestError("oops"), Error);
    ASSERT_THROW(throw UsageError("oops"), Error);
}

TEST(SysError, appendsStrerror)
{
    SysError e(ENOENT, "opening file '%1%'", "foo.toml");

    ASSERT_EQ(e.errNo, ENOENT);
    ASSERT_EQ(filterANSIEscapes(e.message()), "opening file 'foo.toml': No such file or directory");
}

TEST(SysError, usesErrno)
{
    errno = EBADF;
    SysError e("closing");

    ASSERT_EQ(e.errNo, EBADF);
    ASSERT_EQ(e.message(), "closing: Bad file descriptor");
}

/* ----------------------------------------------------------------------------
 * showErrorInfo
 * --------------------------------------------------------------------------*/

TEST(showErrorInfo, messageOnly)
{
    ErrorInfo ei{.level = lvlError, .msg = HintFmt("cannot convert %1%", "a range")};

    ASSERT_EQ(showPlain(ei), "error: cannot convert a range");
}

TEST(showErrorInfo, levels)
{
    ASSERT_EQ(showPlain(ErrorInfo{.level = lvlWarn, .msg = HintFmt("careful")}), "warning: careful");
    ASSERT_EQ(showPlain(ErrorInfo{.level = lvlNotice, .msg = HintFmt("by the way")}), "note: by the way");
    ASSERT_EQ(showPlain(ErrorInfo{.level = lvlInfo, .msg = HintFmt("fyi")}), "info: fyi");
    ASSERT_EQ(showPlain(ErrorInfo{.level = lvlDebug, .msg = HintFmt("details")}), "debug: details");
}

TEST(showErrorInfo, multilineMessageIsIndented)
{
    ErrorInfo ei{.level = lvlError, .msg = HintFmt("first line\nsecond line")};

    ASSERT_EQ(showPlain(ei), "error: first line\n       second line");
}

TEST(showErrorInfo, withPreviousAndNextLinesOfCode)
{
    auto source = std::make_shared<const std::string>("a = 1\nb = [\nc = 3\n");
    ErrorInfo ei{
        .level = lvlError,
        .msg = HintFmt("unterminated array"),
        .pos = std::make_shared<const Pos>(2, 5, Pos::String{.source = source}),
    };

    ASSERT_EQ(
        showPlain(ei),
        "error: unterminated array\n"
        "       at «string»:2:5:\n"
        "            1| a = 1\n"
        "            2| b = [\n"
        "             |     ^\n"
        "            3| c = 3");
}

TEST(showErrorInfo, onFirstLineOfCode)
{
    auto source = std::make_shared<const std::string>("[1,\n");
    ErrorInfo ei{
        .level = lvlError,
        .msg = HintFmt("syntax error"),
        .pos = std::make_shared<const Pos>(1, 4, Pos::Stdin{.source = source}),
    };

    ASSERT_EQ(
        showPlain(ei),
        "error: syntax error\n"
        "       at «stdin»:1:4:\n"
        "            1| [1,\n"
        "             |    ^");
}

TEST(showErrorInfo, positionWithoutSource)
{
    ErrorInfo ei{
        .level = lvlError,
        .msg = HintFmt("bad input"),
        .pos = std::make_shared<const Pos>(3, 7, std::monostate()),
    };

    ASSERT_EQ(showPlain(ei), "error: bad input\n       at «none»:3:7:");
}

TEST(showErrorInfo, unknownPositionIsLeftOut)
{
    ErrorInfo ei{.level = lvlError, .msg = HintFmt("bad input"), .pos = std::make_shared<const Pos>()};

    ASSERT_EQ(showPlain(ei), "error: bad input");
}

/* ----------------------------------------------------------------------------
 * logger
 * --------------------------------------------------------------------------*/

TEST(logEI, writesToStandardError)
{
    testing::internal::CaptureStderr();
    logger->logEI(ErrorInfo{.level = lvlError, .msg = HintFmt("something failed")});
    auto str = testing::internal::GetCapturedStderr();

    ASSERT_EQ(filterANSIEscapes(str), "error: something failed\n");
}

TEST(printMsg, respectsVerbosity)
{
    auto saved = verbosity;
    verbosity = lvlError;

    testing::internal::CaptureStderr();
    printInfo("not shown");
    printError("shown %d", 1);
    warn("not shown either");
    auto str = testing::internal::GetCapturedStderr();

    verbosity = saved;
    ASSERT_EQ(filterANSIEscapes(str), "shown 1\n");
}

} // namespace pipetoml
