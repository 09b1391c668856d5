#pragma once

#include <string>
#include <vector>

namespace fsz::du
{

enum class ExplorerPlatform
{
    Windows,
    MacOS,
    Linux,
    Unsupported
};

ExplorerPlatform currentExplorerPlatform() noexcept;

// argv of the file-manager invocation that reveals `path`; empty when the
// platform has no file manager integration.
std::vector<std::string> explorerCommand(ExplorerPlatform platform, const std::string &path, bool isDirectory);

// Reveals `path` in the platform file manager. On failure returns false and
// stores a message in `error`.
bool openInExplorer(const std::string &path, std::string &error);

} // namespace fsz::du
