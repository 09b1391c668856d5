#include "disk_usage_options.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>

namespace fsz::du
{

void registerDiskUsageOptions(config::OptionRegistry &registry)
{
    registry.registerOption({kOptionWorkerThreads, config::OptionKind::Integer,
                             config::OptionValue(static_cast<std::int64_t>(0)),
                             "Upper bound on parallel size workers; 0 uses every hardware thread."});
    registry.registerOption({kOptionLogLevel, config::OptionKind::String, config::OptionValue(std::string("info")),
                             "Minimum log level: trace, debug, info, warn, error, critical or off."});
    registry.registerOption({kOptionLogFile, config::OptionKind::String, config::OptionValue(std::string()),
                             "Write log output to this file instead of the terminal."});
    registry.registerOption({kOptionLogReadErrors, config::OptionKind::Boolean, config::OptionValue(true),
                             "Log entries that cannot be read while scanning."});
}

AnalysisSettings analysisSettingsFromRegistry(const config::OptionRegistry &registry)
{
    AnalysisSettings settings;
    std::int64_t threads = registry.getInteger(kOptionWorkerThreads, 0);
    constexpr std::int64_t maxThreads = std::numeric_limits<int>::max();
    settings.workerThreads = threads > 0 ? static_cast<std::size_t>(std::min(threads, maxThreads)) : 0;
    settings.logReadErrors = registry.getBool(kOptionLogReadErrors, true);
    return settings;
}

log::LogSettings logSettingsFromRegistry(const config::OptionRegistry &registry)
{
    log::LogSettings settings;
    settings.level = log::parseLevel(registry.getString(kOptionLogLevel, "info"));
    std::string file = registry.getString(kOptionLogFile);
    if (!file.empty())
    {
        settings.file = file;
        settings.console = false;
    }
    return settings;
}

} // namespace fsz::du
