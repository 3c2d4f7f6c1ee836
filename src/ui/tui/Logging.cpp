#include "Logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace otpdeck::ui::tui
{

namespace
{
constexpr const char* g_kLoggerName{ "otpdeck" };
constexpr const char* g_kPattern{ "[%Y-%m-%d %H:%M:%S.%e] [%l] %v" };
constexpr spdlog::level::level_enum g_kFallbackLevel{ spdlog::level::info };

void discardLogging() noexcept
{
    try
    {
        spdlog::drop(g_kLoggerName);
        spdlog::set_default_logger(spdlog::null_logger_mt(g_kLoggerName));
    }
    catch (const spdlog::spdlog_ex&)
    {
        spdlog::set_level(spdlog::level::off);
    }
}

// spdlog maps unknown names to "off"; only an explicit "off" may silence the log.
[[nodiscard]] std::optional<spdlog::level::level_enum> parseLevel(std::string_view name)
{
    const auto parsed{ spdlog::level::from_str(std::string{ name }) };
    if (parsed == spdlog::level::off && name != "off")
    {
        return std::nullopt;
    }
    return parsed;
}
} // namespace

bool initLogging(const std::filesystem::path& logFile, std::string_view level) noexcept
{
    if (logFile.empty())
    {
        discardLogging();
        return false;
    }

    try
    {
        std::error_code ec{};
        std::filesystem::create_directories(logFile.parent_path(), ec);

        spdlog::drop(g_kLoggerName);
        auto logger{ spdlog::basic_logger_mt(g_kLoggerName, logFile.string()) };
        logger->set_pattern(g_kPattern);
        const auto parsed{ parseLevel(level) };
        logger->set_level(parsed.value_or(g_kFallbackLevel));
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
        if (!parsed)
        {
            spdlog::warn("logging: unknown level '{}', using info", level);
        }
        return true;
    }
    catch (const spdlog::spdlog_ex&)
    {
        discardLogging();
        return false;
    }
}

} // namespace otpdeck::ui::tui
