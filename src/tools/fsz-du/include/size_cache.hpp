#pragma once

#include "disk_usage_core.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace fsz::du
{

// Normalized path -> recursive aggregate. Never evicts; the last insert wins.
class SizeCache
{
public:
    std::optional<SizeRecord> get(const std::string &path) const;
    bool contains(const std::string &path) const;
    void insert(const std::string &path, SizeRecord record);
    std::size_t size() const;

private:
    mutable std::mutex mutex;
    std::unordered_map<std::string, SizeRecord> records;
};

// Paths with a background computation running. tryBegin() checks the cache and
// the running set under one lock, so two callers for the same path never both
// win. Lock order is guard then cache.
class InProgressGuard
{
public:
    explicit InProgressGuard(const SizeCache &cache);

    InProgressGuard(const InProgressGuard &) = delete;
    InProgressGuard &operator=(const InProgressGuard &) = delete;

    bool tryBegin(const std::string &path);
    void end(const std::string &path);
    bool contains(const std::string &path) const;
    std::size_t size() const;

private:
    const SizeCache &cache;
    mutable std::mutex mutex;
    std::unordered_set<std::string> running;
};

} // namespace fsz::du
