#pragma once

#include "analysis_service.hpp"
#include "fsz/logging.hpp"
#include "fsz/options.hpp"

namespace fsz::du
{

inline constexpr const char kOptionWorkerThreads[] = "workerThreads";
inline constexpr const char kOptionLogLevel[] = "logLevel";
inline constexpr const char kOptionLogFile[] = "logFile";
inline constexpr const char kOptionLogReadErrors[] = "logReadErrors";

void registerDiskUsageOptions(config::OptionRegistry &registry);

AnalysisSettings analysisSettingsFromRegistry(const config::OptionRegistry &registry);
log::LogSettings logSettingsFromRegistry(const config::OptionRegistry &registry);

} // namespace fsz::du
