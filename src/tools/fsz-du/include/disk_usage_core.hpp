#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fsz::du
{

enum class SizeUnit
{
    Auto,
    Bytes,
    Kilobytes,
    Megabytes,
    Gigabytes,
    Terabytes
};

struct SizeRecord
{
    std::uint64_t totalSize = 0;
    std::uint64_t fileCount = 0;

    bool operator==(const SizeRecord &) const noexcept = default;
};

// One entry of a listing. Only the directory returned as the answer to a
// listing request carries children; entries inside it never do.
struct FileNode
{
    std::string name;
    std::string path;
    std::optional<std::uint64_t> size;
    std::uint64_t baseSize = 0;
    bool isDirectory = false;
    std::uint64_t fileCount = 0;
    std::optional<std::vector<FileNode>> children;
};

struct SizeUpdate
{
    std::string path;
    std::uint64_t size = 0;
    std::uint64_t fileCount = 0;

    bool operator==(const SizeUpdate &) const noexcept = default;
};

struct DirectoryEntry
{
    std::string name;
    std::string path;
    bool isDirectory = false;
    std::uint64_t size = 0;
};

// Rejoins the components of a path in native form. Purely syntactic: no
// filesystem access, symlinks and ".." are left alone, case is preserved.
std::string normalizePath(std::string_view path);

// Receives one SizeUpdate per resolved directory. Called from worker threads.
class SizeUpdateSink
{
public:
    virtual ~SizeUpdateSink() = default;
    virtual void notify(const SizeUpdate &update) = 0;
};

class CallbackSizeUpdateSink : public SizeUpdateSink
{
public:
    explicit CallbackSizeUpdateSink(std::function<void(const SizeUpdate &)> callback);

    void notify(const SizeUpdate &update) override;

private:
    std::function<void(const SizeUpdate &)> callback;
};

class EntrySource
{
public:
    virtual ~EntrySource() = default;

    // Direct entries of a directory, classified without following symlinks.
    // A directory that cannot be read yields an empty list.
    virtual std::vector<DirectoryEntry> readEntries(const std::string &directory) = 0;
};

class FilesystemEntrySource : public EntrySource
{
public:
    using ErrorCallback = std::function<void(const std::string &, const std::error_code &)>;

    FilesystemEntrySource() = default;
    explicit FilesystemEntrySource(ErrorCallback errorCallback);

    std::vector<DirectoryEntry> readEntries(const std::string &directory) override;

private:
    void reportError(const std::string &path, const std::error_code &ec) const;

    ErrorCallback errorCallback;
};

std::string formatSize(std::uint64_t bytes, SizeUnit unit = SizeUnit::Auto);
const char *unitName(SizeUnit unit) noexcept;

} // namespace fsz::du
