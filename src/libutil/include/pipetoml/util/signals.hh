#pragma once
///@file

#include "pipetoml/util/error.hh"

#include <atomic>
#include <functional>

namespace pipetoml {

MakeError(Interrupted, BaseError);

/**
 * Set by the SIGINT and SIGTERM handlers.
 */
extern std::atomic<bool> _isInterrupted;

/**
 * A further source of interruption for the current thread, such as a
 * cancelled request. Consulted by `checkInterrupt()` when set.
 */
extern thread_local std::function<bool()> interruptCheck;

inline void setInterrupted(bool isInterrupted)
{
    _isInterrupted = isInterrupted;
}

inline bool isInterrupted()
{
    return _isInterrupted || (interruptCheck && interruptCheck());
}

/**
 * Throw `Interrupted` if the user or `interruptCheck` asked to stop.
 * Long-running loops call this once per step.
 */
void checkInterrupt();

/**
 * Make SIGINT and SIGTERM set the interrupt flag instead of killing
 * the process.
 */
void installInterruptHandlers();

} // namespace pipetoml
