#pragma once
///@file

#include <string>
#include <string_view>

#include <unistd.h>

namespace pipetoml {

typedef int Descriptor;

/**
 * Read from `fd` until end of file. Checks for interrupts between
 * reads.
 */
std::string drainFD(Descriptor fd);

/**
 * Write all of `s` to `fd`, resuming after partial writes and `EINTR`.
 */
void writeFull(Descriptor fd, std::string_view s, bool allowInterrupts = true);

inline Descriptor getStandardInput()
{
    return STDIN_FILENO;
}

inline Descriptor getStandardOutput()
{
    return STDOUT_FILENO;
}

inline Descriptor getStandardError()
{
    return STDERR_FILENO;
}

} // namespace pipetoml
