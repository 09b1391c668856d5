#include "file_explorer.hpp"

#include "fsz/logging.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#if defined(_WIN32)
#include <process.h>
#else
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;
#endif

namespace fsz::du
{
namespace
{
namespace fs = std::filesystem;

constexpr const char *kUnsupported = "Not supported on this OS";

bool spawnAndWait(const std::vector<std::string> &command, std::string &error)
{
#if defined(_WIN32)
    std::vector<const char *> argv;
    argv.reserve(command.size() + 1);
    for (const auto &token : command)
        argv.push_back(token.c_str());
    argv.push_back(nullptr);

    // explorer.exe reports a non-zero exit code even on success, so only the
    // spawn itself is checked.
    if (_spawnvp(_P_NOWAIT, command.front().c_str(), argv.data()) == -1)
    {
        error = "cannot launch " + command.front() + ": " + std::strerror(errno);
        return false;
    }
    return true;
#else
    std::vector<char *> argv;
    argv.reserve(command.size() + 1);
    for (const auto &token : command)
        argv.push_back(const_cast<char *>(token.c_str()));
    argv.push_back(nullptr);

    pid_t childPid = -1;
    int spawnStatus = posix_spawnp(&childPid, command.front().c_str(), nullptr, nullptr, argv.data(), environ);
    if (spawnStatus != 0)
    {
        error = "cannot launch " + command.front() + ": " + std::strerror(spawnStatus);
        return false;
    }

    int status = 0;
    if (waitpid(childPid, &status, 0) == -1)
    {
        error = "cannot wait for " + command.front() + ": " + std::strerror(errno);
        return false;
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
    {
        int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        error = command.front() + " exited with status " + std::to_string(code);
        return false;
    }
    return true;
#endif
}

} // namespace

ExplorerPlatform currentExplorerPlatform() noexcept
{
#if defined(_WIN32)
    return ExplorerPlatform::Windows;
#elif defined(__APPLE__)
    return ExplorerPlatform::MacOS;
#elif defined(__linux__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
    return ExplorerPlatform::Linux;
#else
    return ExplorerPlatform::Unsupported;
#endif
}

std::vector<std::string> explorerCommand(ExplorerPlatform platform, const std::string &path, bool isDirectory)
{
    switch (platform)
    {
    case ExplorerPlatform::Windows:
        if (isDirectory)
            return {"explorer", path};
        return {"explorer", "/select,", path};
    case ExplorerPlatform::MacOS:
        if (isDirectory)
            return {"open", path};
        return {"open", "-R", path};
    case ExplorerPlatform::Linux:
    {
        if (isDirectory)
            return {"xdg-open", path};
        std::string parent = fs::path(path).parent_path().string();
        return {"xdg-open", parent.empty() ? std::string(".") : parent};
    }
    case ExplorerPlatform::Unsupported:
        break;
    }
    return {};
}

bool openInExplorer(const std::string &path, std::string &error)
{
    std::error_code ec;
    fs::file_status status = fs::status(fs::path(path), ec);
    if (ec || !fs::exists(status))
    {
        error = "Path does not exist: " + path;
        return false;
    }

    std::vector<std::string> command = explorerCommand(currentExplorerPlatform(), path, fs::is_directory(status));
    if (command.empty())
    {
        error = kUnsupported;
        return false;
    }

    log::logger()->debug("revealing '{}' with {}", path, command.front());
    if (!spawnAndWait(command, error))
    {
        log::logger()->warn("cannot reveal '{}': {}", path, error);
        return false;
    }
    return true;
}

} // namespace fsz::du
