#pragma once

#include "disk_usage_core.hpp"
#include "size_cache.hpp"

#include <tbb/task_arena.h>

#include <cstddef>
#include <string>

namespace fsz::du
{

// Recursive size aggregation. Subdirectories are computed in parallel inside a
// bounded task arena; every resolved directory is cached and reported to the
// sink after all of its descendants.
class SizeComputer
{
public:
    // maxConcurrency == 0 or above the hardware concurrency uses every hardware thread.
    SizeComputer(SizeCache &cache, EntrySource &source, SizeUpdateSink &sink, std::size_t maxConcurrency = 0);

    SizeComputer(const SizeComputer &) = delete;
    SizeComputer &operator=(const SizeComputer &) = delete;

    // Never throws. A fault while computing `path` yields {0, 0} and a zeroed
    // update for `path`.
    SizeRecord compute(const std::string &path);

    int concurrency() const;

private:
    SizeRecord computeIsolated(const std::string &path);
    SizeRecord computeDirectory(const std::string &path);
    void reportFault(const std::string &path, const char *reason);
    // A sink failure is logged and does not turn a resolved branch into a fault.
    void deliver(const SizeUpdate &update);

    SizeCache &cache;
    EntrySource &source;
    SizeUpdateSink &sink;
    tbb::task_arena arena;
};

} // namespace fsz::du
