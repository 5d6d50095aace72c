// SPDX-License-Identifier: Apache-2.0
#include <termcore/UnixUtils.h>

#include <cstring>
#include <stdexcept>
#include <string>

using namespace std::string_literals;

namespace termcore
{

UnixPipe::UnixPipe(unsigned flags): pfd { -1, -1 }
{
#if defined(__linux__)
    if (pipe2(pfd.data(), static_cast<int>(flags)) < 0)
        throw std::runtime_error { "Failed to create pipe. "s + strerror(errno) };
#else
    if (pipe(pfd.data()) < 0)
        throw std::runtime_error { "Failed to create pipe. "s + strerror(errno) };
    for (auto const fd: pfd)
        if (!detail::setFileFlags(fd, static_cast<int>(flags)))
            break;
#endif
}

} // namespace termcore
