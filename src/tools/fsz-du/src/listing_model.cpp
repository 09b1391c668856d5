#include "listing_model.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_map>

namespace fsz::du
{
namespace
{

std::string lowercase(const std::string &value)
{
    std::string lowered;
    lowered.reserve(value.size());
    for (char ch : value)
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    return lowered;
}

} // namespace

bool listingOrder(const FileNode &a, const FileNode &b)
{
    if (a.isDirectory != b.isDirectory)
        return a.isDirectory;

    const std::uint64_t sizeA = a.size.value_or(0);
    const std::uint64_t sizeB = b.size.value_or(0);
    if (sizeA != sizeB)
        return sizeA > sizeB;

    return lowercase(a.name) < lowercase(b.name);
}

void sortListing(std::vector<FileNode> &entries)
{
    std::stable_sort(entries.begin(), entries.end(), listingOrder);
}

bool applySizeUpdate(FileNode &root, const SizeUpdate &update)
{
    return applySizeUpdates(root, std::vector<SizeUpdate>{update}) != 0;
}

std::size_t applySizeUpdates(FileNode &root, const std::vector<SizeUpdate> &updates)
{
    if (updates.empty())
        return 0;

    std::unordered_map<std::string, std::size_t> childIndex;
    if (root.children)
    {
        childIndex.reserve(root.children->size());
        for (std::size_t i = 0; i < root.children->size(); ++i)
            childIndex.emplace((*root.children)[i].path, i);
    }

    const std::string rootPath = normalizePath(root.path);
    std::size_t applied = 0;
    bool childChanged = false;
    for (const auto &update : updates)
    {
        const std::string target = normalizePath(update.path);
        if (target == rootPath)
        {
            root.size = update.size;
            root.fileCount = update.fileCount;
            ++applied;
            continue;
        }

        auto it = childIndex.find(target);
        if (it == childIndex.end())
            continue;

        FileNode &child = (*root.children)[it->second];
        child.size = update.size;
        child.fileCount = update.fileCount;
        childChanged = true;
        ++applied;
    }

    if (childChanged)
        sortListing(*root.children);
    return applied;
}

ListingSummary summarizeListing(const FileNode &root)
{
    ListingSummary summary;
    if (!root.children)
        return summary;

    for (const auto &child : *root.children)
    {
        summary.partialSize += child.size.value_or(0);
        summary.partialFileCount += child.fileCount;
        if (child.isDirectory && !child.size)
            summary.hasPending = true;
    }
    return summary;
}

} // namespace fsz::du
