#pragma once

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <string>

namespace fsz::log
{

struct LogSettings
{
    spdlog::level::level_enum level = spdlog::level::info;
    bool console = true;
    std::filesystem::path file;
};

// Replaces the process logger. Falls back to a console sink when the log file
// cannot be opened and no other sink was requested.
void initialize(const LogSettings &settings);

// The shared "fsz" logger. Created on first use with a stderr sink when
// initialize() has not been called.
std::shared_ptr<spdlog::logger> logger();

spdlog::level::level_enum parseLevel(const std::string &name,
                                     spdlog::level::level_enum fallback = spdlog::level::info);

} // namespace fsz::log
