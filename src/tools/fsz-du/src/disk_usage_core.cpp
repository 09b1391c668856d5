#include "disk_usage_core.hpp"

#include <cerrno>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <utility>

namespace fsz::du
{
namespace
{
namespace fs = std::filesystem;

int lstatCompat(const char *path, struct stat *sb)
{
#if defined(_WIN32)
    return stat(path, sb);
#else
    return lstat(path, sb);
#endif
}

std::uint64_t fileLogicalSize(const struct stat &sb)
{
    if (sb.st_size < 0)
        return 0;
    return static_cast<std::uint64_t>(sb.st_size);
}

} // namespace

std::string normalizePath(std::string_view path)
{
    fs::path input{std::string(path)};
    fs::path result;
    bool leading = true;
    for (const auto &component : input)
    {
        // Trailing separators show up as an empty component.
        if (component.empty())
            continue;
        if (!leading && component == ".")
            continue;
        result /= component;
        leading = false;
    }
    result.make_preferred();
    return result.string();
}

CallbackSizeUpdateSink::CallbackSizeUpdateSink(std::function<void(const SizeUpdate &)> callback)
    : callback(std::move(callback))
{
}

void CallbackSizeUpdateSink::notify(const SizeUpdate &update)
{
    if (callback)
        callback(update);
}

FilesystemEntrySource::FilesystemEntrySource(ErrorCallback errorCallback)
    : errorCallback(std::move(errorCallback))
{
}

std::vector<DirectoryEntry> FilesystemEntrySource::readEntries(const std::string &directory)
{
    std::vector<DirectoryEntry> entries;

    std::error_code ec;
    fs::directory_iterator it(fs::path(directory), fs::directory_options::skip_permission_denied, ec);
    if (ec)
    {
        reportError(directory, ec);
        return entries;
    }

    fs::directory_iterator endIter;
    for (; it != endIter; it.increment(ec))
    {
        if (ec)
        {
            reportError(directory, ec);
            break;
        }

        const fs::path &entryPath = it->path();
        struct stat sb{};
        if (lstatCompat(entryPath.c_str(), &sb) != 0)
        {
            reportError(entryPath.string(), std::error_code(errno, std::generic_category()));
            continue;
        }

        DirectoryEntry entry;
        entry.name = entryPath.filename().string();
        entry.path = entryPath.string();
        entry.isDirectory = S_ISDIR(sb.st_mode);
        entry.size = entry.isDirectory ? 0 : fileLogicalSize(sb);
        entries.push_back(std::move(entry));
    }

    return entries;
}

void FilesystemEntrySource::reportError(const std::string &path, const std::error_code &ec) const
{
    if (errorCallback)
        errorCallback(path, ec);
}

const char *unitName(SizeUnit unit) noexcept
{
    switch (unit)
    {
    case SizeUnit::Auto:
        return "Auto";
    case SizeUnit::Bytes:
        return "Bytes";
    case SizeUnit::Kilobytes:
        return "Kilobytes";
    case SizeUnit::Megabytes:
        return "Megabytes";
    case SizeUnit::Gigabytes:
        return "Gigabytes";
    case SizeUnit::Terabytes:
        return "Terabytes";
    }
    return "";
}

std::string formatSize(std::uint64_t bytes, SizeUnit unit)
{
    auto renderValue = [](double value) {
        std::ostringstream out;
        if (value >= 100)
            out << std::fixed << std::setprecision(0);
        else if (value >= 10)
            out << std::fixed << std::setprecision(1);
        else
            out << std::fixed << std::setprecision(2);
        out << value;
        return out.str();
    };

    SizeUnit effectiveUnit = unit;
    if (unit == SizeUnit::Auto)
    {
        if (bytes >= (1ULL << 40))
            effectiveUnit = SizeUnit::Terabytes;
        else if (bytes >= (1ULL << 30))
            effectiveUnit = SizeUnit::Gigabytes;
        else if (bytes >= (1ULL << 20))
            effectiveUnit = SizeUnit::Megabytes;
        else if (bytes >= (1ULL << 10))
            effectiveUnit = SizeUnit::Kilobytes;
        else
            effectiveUnit = SizeUnit::Bytes;
    }

    const double value = static_cast<double>(bytes);
    switch (effectiveUnit)
    {
    case SizeUnit::Auto:
    case SizeUnit::Bytes:
        break;
    case SizeUnit::Kilobytes:
        return renderValue(value / 1024.0) + " KB";
    case SizeUnit::Megabytes:
        return renderValue(value / (1024.0 * 1024.0)) + " MB";
    case SizeUnit::Gigabytes:
        return renderValue(value / (1024.0 * 1024.0 * 1024.0)) + " GB";
    case SizeUnit::Terabytes:
        return renderValue(value / (1024.0 * 1024.0 * 1024.0 * 1024.0)) + " TB";
    }
    return std::to_string(bytes) + " B";
}

} // namespace fsz::du
