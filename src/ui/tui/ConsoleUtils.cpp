#include "ConsoleUtils.hpp"
#include "otpdeck/security/MemoryWiper.hpp"
#include "otpdeck/security/ScopeWipe.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <spdlog/spdlog.h>
#include <string>

#if defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace otpdeck::ui::tui
{

namespace
{

// Turns echo off for its lifetime when stdin is a terminal.
class EchoOffGuard final
{
public:
    EchoOffGuard() noexcept
    {
        if (tcgetattr(STDIN_FILENO, &m_saved) != 0)
        {
            return;
        }
        termios quiet{ m_saved };
        quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        m_active = tcsetattr(STDIN_FILENO, TCSANOW, &quiet) == 0;
    }
    EchoOffGuard(const EchoOffGuard&) = delete;
    EchoOffGuard& operator=(const EchoOffGuard&) = delete;
    ~EchoOffGuard() noexcept
    {
        if (m_active && tcsetattr(STDIN_FILENO, TCSANOW, &m_saved) != 0)
        {
            spdlog::warn("console: could not restore terminal echo");
        }
    }

private:
    termios m_saved{};
    bool m_active{ false };
};

} // namespace

void lockProcessMemory() noexcept
{
    if (mlockall(MCL_CURRENT | MCL_FUTURE) != 0)
    {
        spdlog::debug("console: mlockall failed: {}", std::strerror(errno));
    }
    struct rlimit lim
    {
        0, 0
    };
    if (setrlimit(RLIMIT_CORE, &lim) != 0)
    {
        spdlog::debug("console: disabling core dumps failed: {}", std::strerror(errno));
    }
}

otpdeck::security::SecureString readPassword(const std::string& prompt)
{
    std::cout << prompt << std::flush;

    std::string line;
    {
        const EchoOffGuard echoOff{};
        std::getline(std::cin, line);
    }
    std::cout << "\n";

    auto wipeLine{ otpdeck::security::scopeWipe(line) };
    return otpdeck::security::secureStringFrom(line);
}

std::optional<otpdeck::security::SecureString> passwordFromEnvironment()
{
    const std::string name{ g_kPasswordEnvVar };
    char* value{ std::getenv(name.c_str()) };
    if (value == nullptr)
    {
        return std::nullopt;
    }
    auto password{ otpdeck::security::secureStringFrom(value) };
    otpdeck::security::secureWipeCString(value);
    if (unsetenv(name.c_str()) != 0)
    {
        spdlog::debug("console: unsetenv failed");
    }
    return password;
}

} // namespace otpdeck::ui::tui
