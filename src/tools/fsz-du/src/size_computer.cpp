#include "size_computer.hpp"

#include "fsz/logging.hpp"

#include <tbb/blocked_range.h>
#include <tbb/info.h>
#include <tbb/parallel_for.h>

#include <algorithm>
#include <exception>
#include <vector>

namespace fsz::du
{
namespace
{

// Requests above the hardware concurrency are capped to it.
int arenaConcurrency(std::size_t requested)
{
    const int available = std::max(1, tbb::info::default_concurrency());
    if (requested == 0)
        return available;
    return static_cast<int>(std::min<std::size_t>(requested, static_cast<std::size_t>(available)));
}

} // namespace

SizeComputer::SizeComputer(SizeCache &cache, EntrySource &source, SizeUpdateSink &sink, std::size_t maxConcurrency)
    : cache(cache),
      source(source),
      sink(sink),
      arena(arenaConcurrency(maxConcurrency))
{
}

SizeRecord SizeComputer::compute(const std::string &path)
{
    return arena.execute([this, &path] { return computeIsolated(path); });
}

int SizeComputer::concurrency() const
{
    return arena.max_concurrency();
}

SizeRecord SizeComputer::computeIsolated(const std::string &path)
{
    try
    {
        return computeDirectory(path);
    }
    catch (const std::exception &ex)
    {
        reportFault(path, ex.what());
    }
    catch (...)
    {
        reportFault(path, "unknown exception");
    }
    return SizeRecord{};
}

SizeRecord SizeComputer::computeDirectory(const std::string &path)
{
    if (auto cached = cache.get(path))
        return *cached;

    SizeRecord total;
    std::vector<std::string> subdirectories;
    for (auto &entry : source.readEntries(path))
    {
        if (entry.isDirectory)
        {
            subdirectories.push_back(std::move(entry.path));
            continue;
        }
        total.totalSize += entry.size;
        ++total.fileCount;
    }

    std::vector<SizeRecord> results(subdirectories.size());
    tbb::parallel_for(tbb::blocked_range<std::size_t>(0, subdirectories.size()),
                      [&](const tbb::blocked_range<std::size_t> &range) {
                          for (std::size_t i = range.begin(); i != range.end(); ++i)
                              results[i] = computeIsolated(subdirectories[i]);
                      });

    for (const auto &child : results)
    {
        total.totalSize += child.totalSize;
        total.fileCount += child.fileCount;
    }

    cache.insert(path, total);
    deliver(SizeUpdate{path, total.totalSize, total.fileCount});
    return total;
}

void SizeComputer::deliver(const SizeUpdate &update)
{
    try
    {
        sink.notify(update);
    }
    catch (const std::exception &ex)
    {
        log::logger()->error("cannot report size of '{}': {}", update.path, ex.what());
    }
}

void SizeComputer::reportFault(const std::string &path, const char *reason)
{
    log::logger()->warn("size computation failed for '{}': {}", path, reason);
    deliver(SizeUpdate{path, 0, 0});
}

} // namespace fsz::du
