#include <gtest/gtest.h>

#include "file_explorer.hpp"
#include "fsz_du/test_support.hpp"

#include <string>
#include <vector>

using fsz::du::ExplorerPlatform;
using Command = std::vector<std::string>;

TEST(FileExplorer, BuildsWindowsCommands)
{
    EXPECT_EQ(fsz::du::explorerCommand(ExplorerPlatform::Windows, "C:\\data", true), (Command{"explorer", "C:\\data"}));
    EXPECT_EQ(fsz::du::explorerCommand(ExplorerPlatform::Windows, "C:\\data\\a.txt", false),
              (Command{"explorer", "/select,", "C:\\data\\a.txt"}));
}

TEST(FileExplorer, BuildsMacCommands)
{
    EXPECT_EQ(fsz::du::explorerCommand(ExplorerPlatform::MacOS, "/Users/me", true), (Command{"open", "/Users/me"}));
    EXPECT_EQ(fsz::du::explorerCommand(ExplorerPlatform::MacOS, "/Users/me/a.txt", false),
              (Command{"open", "-R", "/Users/me/a.txt"}));
}

TEST(FileExplorer, LinuxOpensContainingFolderForFiles)
{
    EXPECT_EQ(fsz::du::explorerCommand(ExplorerPlatform::Linux, "/home/me", true), (Command{"xdg-open", "/home/me"}));
    EXPECT_EQ(fsz::du::explorerCommand(ExplorerPlatform::Linux, "/home/me/a.txt", false),
              (Command{"xdg-open", "/home/me"}));
    EXPECT_EQ(fsz::du::explorerCommand(ExplorerPlatform::Linux, "a.txt", false), (Command{"xdg-open", "."}));
}

TEST(FileExplorer, UnsupportedPlatformHasNoCommand)
{
    EXPECT_TRUE(fsz::du::explorerCommand(ExplorerPlatform::Unsupported, "/x", true).empty());
}

TEST(FileExplorer, RejectsMissingPath)
{
    fsz::du::testing::TempTree tree;
    auto missing = (tree.root() / "nope").string();

    std::string error;
    EXPECT_FALSE(fsz::du::openInExplorer(missing, error));
    EXPECT_EQ(error, "Path does not exist: " + missing);
}

TEST(FileExplorer, DetectsHostPlatform)
{
#if defined(_WIN32)
    EXPECT_EQ(fsz::du::currentExplorerPlatform(), ExplorerPlatform::Windows);
#elif defined(__APPLE__)
    EXPECT_EQ(fsz::du::currentExplorerPlatform(), ExplorerPlatform::MacOS);
#elif defined(__linux__)
    EXPECT_EQ(fsz::du::currentExplorerPlatform(), ExplorerPlatform::Linux);
#endif
}
