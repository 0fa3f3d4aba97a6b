#include "pipetoml/util/terminal.hh"

#include <cstdlib>
#include <cstring>

#include <unistd.h>

namespace pipetoml {

bool shouldANSI()
{
    if (getenv("NO_COLOR"))
        return false;
    if (getenv("FORCE_COLOR"))
        return true;
    auto term = getenv("TERM");
    return isatty(STDERR_FILENO) && term && strcmp(term, "dumb") != 0;
}

std::string filterANSIEscapes(std::string_view s)
{
    std::string res;
    res.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        if (s[i] != '\e') {
            res += s[i++];
            continue;
        }
        ++i;
        if (i < s.size() && s[i] == '[') {
            /* CSI: parameter and intermediate bytes, then one final byte. */
            ++i;
            while (i < s.size() && s[i] >= 0x20 && s[i] <= 0x3f)
                ++i;
            if (i < s.size() && s[i] >= 0x40 && s[i] <= 0x7e)
                ++i;
        } else if (i < s.size() && s[i] >= 0x40 && s[i] <= 0x5f)
            ++i;
    }

    return res;
}

} // namespace pipetoml
