// SPDX-License-Identifier: Apache-2.0
#include <termcore/Subprocess.h>
#include <termcore/UnixUtils.h>
#include <termcore/logging.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <sys/types.h>
#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

using std::chrono::milliseconds;
using std::chrono::steady_clock;
using std::optional;
using std::string;
using std::vector;

namespace termcore
{

namespace
{
    constexpr auto ReapInterval = milliseconds(5);

    void killAndReap(pid_t pid) noexcept
    {
        ::kill(pid, SIGKILL);
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
            ;
    }

    // Waits for @p pid to exit, killing it once @p deadline has passed.
    optional<int> reap(pid_t pid, string const& program, steady_clock::time_point deadline)
    {
        int status = 0;
        for (;;)
        {
            auto const rv = waitpid(pid, &status, WNOHANG);
            if (rv < 0 && errno == EINTR)
                continue;
            if (rv < 0)
            {
                errorlog()("waitpid() failed: {}", strerror(errno));
                return std::nullopt;
            }
            if (rv == pid)
                break;
            if (steady_clock::now() >= deadline)
            {
                backendLog()("{} closed its output but did not exit in time, killing it.", program);
                killAndReap(pid);
                return std::nullopt;
            }
            std::this_thread::sleep_for(ReapInterval);
        }

        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        return std::nullopt;
    }

    [[noreturn]] void execChild(string const& program, vector<string> const& args, int stdoutFd)
    {
        // reset signal(s) to default that may have been changed in the parent process.
        signal(SIGPIPE, SIG_DFL);

        while (dup2(stdoutFd, STDOUT_FILENO) == -1 && errno == EINTR)
            ;
        if (int const devNull = open("/dev/null", O_WRONLY); devNull >= 0)
            dup2(devNull, STDERR_FILENO);

        auto argv = vector<char*> {};
        argv.reserve(args.size() + 2);
        argv.push_back(const_cast<char*>(program.c_str()));
        for (auto const& arg: args)
            argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);

        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }
} // namespace

optional<ProcessOutput> runProcess(string const& program, vector<string> const& args, milliseconds timeout)
{
    auto pipe = UnixPipe(O_CLOEXEC);

    pid_t const pid = fork();
    switch (pid)
    {
        case -1: // fork error
            errorlog()("Failed to spawn {}. {}", program, strerror(errno));
            return std::nullopt;
        case 0: // in child
            pipe.closeReader();
            execChild(program, args, pipe.writer());
        default: // in parent
            pipe.closeWriter();
            break;
    }

    auto const deadline = steady_clock::now() + timeout;
    auto output = ProcessOutput {};
    auto buffer = std::array<char, 4096> {};

    for (;;)
    {
        auto const remaining = std::chrono::duration_cast<milliseconds>(deadline - steady_clock::now());
        if (remaining.count() <= 0)
        {
            backendLog()("{} did not finish within {}ms, killing it.", program, timeout.count());
            killAndReap(pid);
            return std::nullopt;
        }

        auto pfd = pollfd { pipe.reader(), POLLIN, 0 };
        int const rv = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rv < 0 && errno == EINTR)
            continue;
        if (rv < 0)
        {
            errorlog()("poll() failed while reading from {}: {}", program, strerror(errno));
            killAndReap(pid);
            return std::nullopt;
        }
        if (rv == 0)
            continue;

        auto const n = ::read(pipe.reader(), buffer.data(), buffer.size());
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            break;
        output.standardOutput.append(buffer.data(), static_cast<size_t>(n));
    }

    auto const exitCode = reap(pid, program, deadline);
    if (!exitCode)
        return std::nullopt;

    output.exitCode = *exitCode;
    return output;
}

} // namespace termcore
