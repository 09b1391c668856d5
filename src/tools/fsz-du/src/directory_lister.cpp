#include "directory_lister.hpp"

#include "fsz/logging.hpp"
#include "listing_model.hpp"

#include <exception>
#include <filesystem>
#include <utility>
#include <vector>

namespace fsz::du
{

DirectoryLister::DirectoryLister(const SizeCache &cache, InProgressGuard &inProgress, EntrySource &source,
                                 SizeComputer &computer, BackgroundTasks &tasks)
    : cache(cache), inProgress(inProgress), source(source), computer(computer), tasks(tasks)
{
}

FileNode DirectoryLister::list(std::string_view path)
{
    const std::string root = normalizePath(path);

    std::vector<FileNode> children;
    std::uint64_t baseSize = 0;
    for (auto &entry : readRootEntries(root))
    {
        if (!entry.isDirectory)
            baseSize += entry.size;
        children.push_back(makeEntryNode(std::move(entry)));
    }
    sortListing(children);

    if (inProgress.tryBegin(root))
        scheduleRootComputation(root);

    FileNode node;
    node.name = std::filesystem::path(root).filename().string();
    if (node.name.empty())
        node.name = root;
    node.path = root;
    node.isDirectory = true;
    node.baseSize = baseSize;
    if (auto cached = cache.get(root))
    {
        node.size = cached->totalSize;
        node.fileCount = cached->fileCount;
    }
    node.children = std::move(children);
    return node;
}

std::vector<DirectoryEntry> DirectoryLister::readRootEntries(const std::string &root)
{
    try
    {
        return source.readEntries(root);
    }
    catch (const std::exception &ex)
    {
        log::logger()->warn("cannot list '{}': {}", root, ex.what());
    }
    catch (...)
    {
        log::logger()->warn("cannot list '{}': unknown exception", root);
    }
    return {};
}

FileNode DirectoryLister::makeEntryNode(DirectoryEntry entry) const
{
    FileNode node;
    node.name = std::move(entry.name);
    node.path = std::move(entry.path);
    node.isDirectory = entry.isDirectory;
    if (!entry.isDirectory)
    {
        node.size = entry.size;
        node.baseSize = entry.size;
        node.fileCount = 1;
        return node;
    }

    if (auto cached = cache.get(node.path))
    {
        node.size = cached->totalSize;
        node.fileCount = cached->fileCount;
    }
    return node;
}

void DirectoryLister::scheduleRootComputation(const std::string &root)
{
    SizeComputer &sizeComputer = computer;
    InProgressGuard &guard = inProgress;
    try
    {
        tasks.submit("size:" + root, [&sizeComputer, &guard, root] {
            struct Release
            {
                InProgressGuard &guard;
                const std::string &path;
                ~Release() { guard.end(path); }
            } release{guard, root};

            SizeRecord record = sizeComputer.compute(root);
            log::logger()->debug("resolved '{}': {} bytes in {} files", root, record.totalSize, record.fileCount);
        });
    }
    catch (const std::exception &ex)
    {
        guard.end(root);
        log::logger()->error("cannot start size computation for '{}': {}", root, ex.what());
    }
}

} // namespace fsz::du
