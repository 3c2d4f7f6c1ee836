#include "Clipboard.hpp"

#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

namespace otpdeck::ui::tui
{
namespace
{

constexpr int g_kExecFailed{ 127 };

[[nodiscard]] bool writeAll(int fd, std::string_view data) noexcept
{
    const char* ptr{ data.data() };
    std::size_t remaining{ data.size() };
    while (remaining > 0U)
    {
        const ssize_t w{ write(fd, ptr, remaining) };
        if (w < 0 && errno == EINTR)
        {
            continue;
        }
        if (w <= 0)
        {
            return false;
        }
        ptr += w;
        remaining -= static_cast<std::size_t>(w);
    }
    return true;
}

[[nodiscard]] bool runWriterWithStdin(const std::vector<std::string>& argv, std::string_view input) noexcept
{
    int pipefd[2]{ -1, -1 };
    if (pipe(pipefd) != 0)
    {
        return false;
    }

    std::vector<char*> args{};
    args.reserve(argv.size() + 1U);
    for (const auto& a : argv)
    {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    const pid_t pid{ fork() };
    if (pid < 0)
    {
        close(pipefd[0]);
        close(pipefd[1]);
        return false;
    }

    if (pid == 0)
    {
        dup2(pipefd[0], STDIN_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);
        const int devNull{ open("/dev/null", O_WRONLY) };
        if (devNull >= 0)
        {
            dup2(devNull, STDOUT_FILENO);
            dup2(devNull, STDERR_FILENO);
            close(devNull);
        }
        execvp(args[0], args.data());
        _exit(g_kExecFailed);
    }

    close(pipefd[0]);
    // A tool that exits early must not kill us with SIGPIPE.
    struct sigaction ignore
    {
    };
    struct sigaction previous
    {
    };
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, &previous);
    const bool written{ writeAll(pipefd[1], input) };
    close(pipefd[1]);
    sigaction(SIGPIPE, &previous, nullptr);

    int status{ 0 };
    while (waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            return false;
        }
    }
    return written && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

} // namespace

std::vector<std::string> splitCommandLine(std::string_view commandLine)
{
    std::vector<std::string> out{};
    std::string current{};
    for (const char c : commandLine)
    {
        if (c == ' ' || c == '\t' || c == '\n')
        {
            if (!current.empty())
            {
                out.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty())
    {
        out.push_back(std::move(current));
    }
    return out;
}

bool copyToClipboard(std::string_view tool, std::string_view text) noexcept
{
    try
    {
        const auto argv{ splitCommandLine(tool) };
        if (argv.empty())
        {
            spdlog::debug("clipboard: no tool configured");
            return false;
        }
        const bool ok{ runWriterWithStdin(argv, text) };
        if (!ok)
        {
            spdlog::warn("clipboard: '{}' failed", argv.front());
        }
        return ok;
    }
    catch (const std::exception& e)
    {
        spdlog::warn("clipboard: {}", e.what());
        return false;
    }
}

} // namespace otpdeck::ui::tui
