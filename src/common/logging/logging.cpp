#include "fsz/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cctype>
#include <mutex>
#include <vector>

namespace fsz::log
{
namespace
{
constexpr const char *kLoggerName = "fsz";
constexpr const char *kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";

std::mutex gLoggerMutex;
std::shared_ptr<spdlog::logger> gLogger;

std::shared_ptr<spdlog::logger> makeConsoleLogger()
{
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern(kPattern);
    auto created = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
    created->flush_on(spdlog::level::warn);
    return created;
}

} // namespace

void initialize(const LogSettings &settings)
{
    std::vector<spdlog::sink_ptr> sinks;
    if (settings.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string fileError;
    if (!settings.file.empty())
    {
        try
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.file.string()));
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            fileError = ex.what();
            if (sinks.empty())
                sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }
    }

    for (auto &sink : sinks)
        sink->set_pattern(kPattern);

    auto created = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    created->set_level(settings.level);
    created->flush_on(spdlog::level::warn);

    {
        std::lock_guard<std::mutex> lock(gLoggerMutex);
        gLogger = created;
    }

    if (!fileError.empty())
        created->warn("cannot open log file '{}': {}", settings.file.string(), fileError);
}

std::shared_ptr<spdlog::logger> logger()
{
    std::lock_guard<std::mutex> lock(gLoggerMutex);
    if (!gLogger)
        gLogger = makeConsoleLogger();
    return gLogger;
}

spdlog::level::level_enum parseLevel(const std::string &name, spdlog::level::level_enum fallback)
{
    std::string lower;
    lower.reserve(name.size());
    for (char ch : name)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));

    if (lower == "trace")
        return spdlog::level::trace;
    if (lower == "debug")
        return spdlog::level::debug;
    if (lower == "info")
        return spdlog::level::info;
    if (lower == "warn" || lower == "warning")
        return spdlog::level::warn;
    if (lower == "error" || lower == "err")
        return spdlog::level::err;
    if (lower == "critical")
        return spdlog::level::critical;
    if (lower == "off")
        return spdlog::level::off;
    return fallback;
}

} // namespace fsz::log
