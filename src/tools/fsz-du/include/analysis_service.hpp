#pragma once

#include "background_tasks.hpp"
#include "directory_lister.hpp"
#include "disk_usage_core.hpp"
#include "size_cache.hpp"
#include "size_computer.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <string>

namespace fsz::du
{

inline constexpr const char kFolderSizeUpdatedEvent[] = "folder-size-updated";

struct AnalysisSettings
{
    std::size_t workerThreads = 0;
    bool logReadErrors = true;
};

// Process-wide analysis context: owns the size cache, the in-progress guard and
// the workers, and borrows the host's event sink. Destruction waits for every
// background computation to finish.
class AnalysisService
{
public:
    explicit AnalysisService(SizeUpdateSink &sink, AnalysisSettings settings = {});
    AnalysisService(SizeUpdateSink &sink, std::unique_ptr<EntrySource> source, AnalysisSettings settings = {});
    ~AnalysisService();

    AnalysisService(const AnalysisService &) = delete;
    AnalysisService &operator=(const AnalysisService &) = delete;

    FileNode analyzeDirectory(const std::string &path);
    bool openInExplorer(const std::string &path, std::string &error) const;

    void waitForIdle();

    const SizeCache &cache() const noexcept { return sizeCache; }
    const InProgressGuard &inProgress() const noexcept { return inProgressGuard; }
    const AnalysisSettings &settings() const noexcept { return currentSettings; }

private:
    AnalysisSettings currentSettings;
    SizeCache sizeCache;
    InProgressGuard inProgressGuard;
    std::unique_ptr<EntrySource> source;
    SizeComputer computer;
    BackgroundTasks tasks;
    DirectoryLister lister;
};

nlohmann::json toJson(const SizeUpdate &update);
nlohmann::json toJson(const FileNode &node);

} // namespace fsz::du
