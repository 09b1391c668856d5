#pragma once

#include "background_tasks.hpp"
#include "disk_usage_core.hpp"
#include "size_cache.hpp"
#include "size_computer.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace fsz::du
{

// One-level listings. Reads the cache but never computes; the recursive size of
// the listed root is handed to a background task at most once per path.
class DirectoryLister
{
public:
    DirectoryLister(const SizeCache &cache, InProgressGuard &inProgress, EntrySource &source,
                    SizeComputer &computer, BackgroundTasks &tasks);

    FileNode list(std::string_view path);

private:
    std::vector<DirectoryEntry> readRootEntries(const std::string &root);
    FileNode makeEntryNode(DirectoryEntry entry) const;
    void scheduleRootComputation(const std::string &root);

    const SizeCache &cache;
    InProgressGuard &inProgress;
    EntrySource &source;
    SizeComputer &computer;
    BackgroundTasks &tasks;
};

} // namespace fsz::du
