#include "pipetoml/util/signals.hh"

#include <exception>

#include <signal.h>

namespace pipetoml {

std::atomic<bool> _isInterrupted = false;

thread_local std::function<bool()> interruptCheck;

void checkInterrupt()
{
    /* Never throw while another exception is unwinding the stack. */
    if (isInterrupted() && !std::uncaught_exceptions())
        throw Interrupted("interrupted by the user");
}

static void onInterrupt(int)
{
    _isInterrupted = true;
}

void installInterruptHandlers()
{
    struct sigaction act = {};
    act.sa_handler = onInterrupt;
    sigfillset(&act.sa_mask);

    for (auto sig : {SIGINT, SIGTERM})
        if (sigaction(sig, &act, nullptr))
            throw SysError("installing handler for signal %d", sig);
}

} // namespace pipetoml
