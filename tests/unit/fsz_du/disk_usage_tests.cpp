#include <gtest/gtest.h>

#include "disk_usage_core.hpp"
#include "disk_usage_options.hpp"
#include "fsz_du/test_support.hpp"

#include "fsz/options.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using fsz::du::testing::TempTree;

namespace
{

const fsz::du::DirectoryEntry *findEntry(const std::vector<fsz::du::DirectoryEntry> &entries, const std::string &name)
{
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const fsz::du::DirectoryEntry &entry) { return entry.name == name; });
    return it == entries.end() ? nullptr : &*it;
}

} // namespace

TEST(DiskUsageCore, FormatsSizesAcrossUnits)
{
    EXPECT_EQ(fsz::du::formatSize(512, fsz::du::SizeUnit::Bytes), "512 B");
    EXPECT_EQ(fsz::du::formatSize(1024, fsz::du::SizeUnit::Kilobytes), "1.00 KB");
    EXPECT_EQ(fsz::du::formatSize(1536, fsz::du::SizeUnit::Kilobytes), "1.50 KB");
    EXPECT_EQ(fsz::du::formatSize(1048576, fsz::du::SizeUnit::Megabytes), "1.00 MB");
    EXPECT_EQ(fsz::du::formatSize(1073741824, fsz::du::SizeUnit::Gigabytes), "1.00 GB");
}

TEST(DiskUsageCore, PicksUnitAutomatically)
{
    EXPECT_EQ(fsz::du::formatSize(0), "0 B");
    EXPECT_EQ(fsz::du::formatSize(1023), "1023 B");
    EXPECT_EQ(fsz::du::formatSize(10 * 1024), "10.0 KB");
    EXPECT_EQ(fsz::du::formatSize(200 * 1024), "200 KB");
    EXPECT_EQ(fsz::du::formatSize(3ULL << 40), "3.00 TB");
}

TEST(DiskUsageCore, ProvidesUnitLabels)
{
    EXPECT_STREQ(fsz::du::unitName(fsz::du::SizeUnit::Auto), "Auto");
    EXPECT_STREQ(fsz::du::unitName(fsz::du::SizeUnit::Terabytes), "Terabytes");
}

TEST(PathNormalizer, DropsTrailingSeparatorsAndCurrentDirComponents)
{
    EXPECT_EQ(fsz::du::normalizePath("/a/b/"), "/a/b");
    EXPECT_EQ(fsz::du::normalizePath("/a/./b"), "/a/b");
    EXPECT_EQ(fsz::du::normalizePath("/./a"), "/a");
    EXPECT_EQ(fsz::du::normalizePath("a//b"), "a/b");
    EXPECT_EQ(fsz::du::normalizePath("/a/b"), fsz::du::normalizePath("/a/b/"));
}

TEST(PathNormalizer, KeepsLeadingCurrentDirParentDirsAndCase)
{
    EXPECT_EQ(fsz::du::normalizePath("./a"), "./a");
    EXPECT_EQ(fsz::du::normalizePath("/a/../b"), "/a/../b");
    EXPECT_EQ(fsz::du::normalizePath("/Data/Photos"), "/Data/Photos");
    EXPECT_EQ(fsz::du::normalizePath("/"), "/");
    EXPECT_EQ(fsz::du::normalizePath(""), "");
}

TEST(PathNormalizer, IsIdempotent)
{
    for (const char *raw : {"/a/b/", "./x/./y/", "rel/../other", "/", "a"})
    {
        std::string once = fsz::du::normalizePath(raw);
        EXPECT_EQ(fsz::du::normalizePath(once), once) << raw;
    }
}

TEST(CallbackSizeUpdateSink, ForwardsUpdates)
{
    std::vector<fsz::du::SizeUpdate> seen;
    fsz::du::CallbackSizeUpdateSink sink([&](const fsz::du::SizeUpdate &update) { seen.push_back(update); });
    sink.notify({"/a", 10, 1});
    sink.notify({"/b", 0, 0});

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], (fsz::du::SizeUpdate{"/a", 10, 1}));
    EXPECT_EQ(seen[1].path, "/b");
}

TEST(FilesystemEntrySource, ClassifiesDirectEntries)
{
    TempTree tree;
    tree.writeFile("one.bin", 100);
    tree.writeFile("nested/two.bin", 40);

    fsz::du::FilesystemEntrySource source;
    auto entries = source.readEntries(tree.root().string());
    ASSERT_EQ(entries.size(), 2u);

    const auto *file = findEntry(entries, "one.bin");
    ASSERT_NE(file, nullptr);
    EXPECT_FALSE(file->isDirectory);
    EXPECT_EQ(file->size, 100u);
    EXPECT_EQ(file->path, (tree.root() / "one.bin").string());

    const auto *dir = findEntry(entries, "nested");
    ASSERT_NE(dir, nullptr);
    EXPECT_TRUE(dir->isDirectory);
    EXPECT_EQ(dir->size, 0u);
}

TEST(FilesystemEntrySource, DoesNotFollowDirectorySymlinks)
{
    TempTree tree;
    auto target = tree.makeDirectory("target");
    tree.writeFile("target/data.bin", 64);

    std::error_code ec;
    std::filesystem::create_directory_symlink(target, tree.root() / "link", ec);
    if (ec)
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();

    fsz::du::FilesystemEntrySource source;
    auto entries = source.readEntries(tree.root().string());
    const auto *link = findEntry(entries, "link");
    ASSERT_NE(link, nullptr);
    EXPECT_FALSE(link->isDirectory);
}

TEST(FilesystemEntrySource, ReportsUnreadableDirectoryAsEmpty)
{
    TempTree tree;
    std::vector<std::string> failures;
    fsz::du::FilesystemEntrySource source(
        [&](const std::string &path, const std::error_code &) { failures.push_back(path); });

    auto missing = (tree.root() / "missing").string();
    EXPECT_TRUE(source.readEntries(missing).empty());
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures.front(), missing);
}

TEST(DiskUsageOptions, RegistersExpectedDefinitions)
{
    fsz::config::OptionRegistry registry("fsz-du");
    fsz::du::registerDiskUsageOptions(registry);

    EXPECT_TRUE(registry.hasOption("workerThreads"));
    EXPECT_TRUE(registry.hasOption("logLevel"));

    auto options = registry.listRegisteredOptions();
    std::vector<std::string> keys;
    keys.reserve(options.size());
    for (const auto &definition : options)
        keys.push_back(definition.key);

    EXPECT_NE(std::find(keys.begin(), keys.end(), "logReadErrors"), keys.end());
    EXPECT_NE(std::find(keys.begin(), keys.end(), "logFile"), keys.end());
}

TEST(DiskUsageOptions, TranslatesRegistryIntoSettings)
{
    fsz::config::OptionRegistry registry("fsz-du");
    fsz::du::registerDiskUsageOptions(registry);

    auto defaults = fsz::du::analysisSettingsFromRegistry(registry);
    EXPECT_EQ(defaults.workerThreads, 0u);
    EXPECT_TRUE(defaults.logReadErrors);

    registry.set("workerThreads", fsz::config::OptionValue(std::int64_t{3}));
    registry.set("logReadErrors", fsz::config::OptionValue(false));
    registry.set("logLevel", fsz::config::OptionValue(std::string("debug")));
    registry.set("logFile", fsz::config::OptionValue(std::string("/tmp/fsz.log")));

    auto settings = fsz::du::analysisSettingsFromRegistry(registry);
    EXPECT_EQ(settings.workerThreads, 3u);
    EXPECT_FALSE(settings.logReadErrors);

    auto logSettings = fsz::du::logSettingsFromRegistry(registry);
    EXPECT_EQ(logSettings.level, spdlog::level::debug);
    EXPECT_EQ(logSettings.file.string(), "/tmp/fsz.log");
    EXPECT_FALSE(logSettings.console);
}

TEST(DiskUsageOptions, IgnoresNegativeWorkerCounts)
{
    fsz::config::OptionRegistry registry("fsz-du");
    fsz::du::registerDiskUsageOptions(registry);
    registry.set("workerThreads", fsz::config::OptionValue(std::int64_t{-4}));

    EXPECT_EQ(fsz::du::analysisSettingsFromRegistry(registry).workerThreads, 0u);
}

TEST(DiskUsageOptions, CapsOversizedWorkerCounts)
{
    fsz::config::OptionRegistry registry("fsz-du");
    fsz::du::registerDiskUsageOptions(registry);
    registry.set("workerThreads", fsz::config::OptionValue(std::int64_t{4294967297}));

    EXPECT_EQ(fsz::du::analysisSettingsFromRegistry(registry).workerThreads,
              static_cast<std::size_t>(std::numeric_limits<int>::max()));
}
