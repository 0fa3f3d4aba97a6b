#include "pipetoml/util/file-descriptor.hh"
#include "pipetoml/util/error.hh"
#include "pipetoml/util/signals.hh"

#include <array>

namespace pipetoml {

std::string drainFD(Descriptor fd)
{
    std::string s;
    std::array<char, 64 * 1024> buf;

    while (true) {
        checkInterrupt();
        auto n = read(fd, buf.data(), buf.size());
        if (n == 0)
            return s;
        if (n == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("reading from file descriptor %d", fd);
        }
        s.append(buf.data(), n);
    }
}

void writeFull(Descriptor fd, std::string_view s, bool allowInterrupts)
{
    while (!s.empty()) {
        if (allowInterrupts)
            checkInterrupt();
        auto n = write(fd, s.data(), s.size());
        if (n == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("writing to file descriptor %d", fd);
        }
        s.remove_prefix(n);
    }
}

} // namespace pipetoml
