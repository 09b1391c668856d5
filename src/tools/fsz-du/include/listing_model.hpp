#pragma once

#include "disk_usage_core.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace fsz::du
{

struct ListingSummary
{
    std::uint64_t partialSize = 0;
    std::uint64_t partialFileCount = 0;
    bool hasPending = false;
};

// Directories first, then size descending with an unknown size counted as 0,
// then case-insensitive name.
bool listingOrder(const FileNode &a, const FileNode &b);
void sortListing(std::vector<FileNode> &entries);

// Applies an update to the listing root or one of its children and restores
// the listing order. Returns false when no node matches the update's path.
bool applySizeUpdate(FileNode &root, const SizeUpdate &update);

// Batch form of applySizeUpdate: children are indexed once and re-sorted at
// most once. Child paths are expected in normalized form, as the lister
// produces them. Returns the number of updates that matched a node.
std::size_t applySizeUpdates(FileNode &root, const std::vector<SizeUpdate> &updates);

// Running totals over the children whose sizes are already known.
ListingSummary summarizeListing(const FileNode &root);

} // namespace fsz::du
