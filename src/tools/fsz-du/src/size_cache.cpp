#include "size_cache.hpp"

namespace fsz::du
{

std::optional<SizeRecord> SizeCache::get(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex);
    auto it = records.find(path);
    if (it == records.end())
        return std::nullopt;
    return it->second;
}

bool SizeCache::contains(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex);
    return records.find(path) != records.end();
}

void SizeCache::insert(const std::string &path, SizeRecord record)
{
    std::lock_guard<std::mutex> lock(mutex);
    records[path] = record;
}

std::size_t SizeCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return records.size();
}

InProgressGuard::InProgressGuard(const SizeCache &cache)
    : cache(cache)
{
}

bool InProgressGuard::tryBegin(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex);
    if (cache.contains(path))
        return false;
    return running.insert(path).second;
}

void InProgressGuard::end(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex);
    running.erase(path);
}

bool InProgressGuard::contains(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex);
    return running.find(path) != running.end();
}

std::size_t InProgressGuard::size() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return running.size();
}

} // namespace fsz::du
