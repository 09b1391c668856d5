#include "analysis_service.hpp"

#include "file_explorer.hpp"
#include "fsz/logging.hpp"

#include <utility>

namespace fsz::du
{
namespace
{

std::unique_ptr<EntrySource> makeFilesystemSource(const AnalysisSettings &settings)
{
    if (!settings.logReadErrors)
        return std::make_unique<FilesystemEntrySource>();
    return std::make_unique<FilesystemEntrySource>([](const std::string &path, const std::error_code &ec) {
        log::logger()->debug("cannot read '{}': {}", path, ec.message());
    });
}

} // namespace

AnalysisService::AnalysisService(SizeUpdateSink &sink, AnalysisSettings settings)
    : AnalysisService(sink, makeFilesystemSource(settings), settings)
{
}

AnalysisService::AnalysisService(SizeUpdateSink &sink, std::unique_ptr<EntrySource> entrySource,
                                 AnalysisSettings settings)
    : currentSettings(settings),
      inProgressGuard(sizeCache),
      source(std::move(entrySource)),
      computer(sizeCache, *source, sink, settings.workerThreads),
      lister(sizeCache, inProgressGuard, *source, computer, tasks)
{
    log::logger()->debug("analysis service ready ({} workers)", computer.concurrency());
}

AnalysisService::~AnalysisService()
{
    tasks.close();
    tasks.waitIdle();
}

FileNode AnalysisService::analyzeDirectory(const std::string &path)
{
    return lister.list(path);
}

bool AnalysisService::openInExplorer(const std::string &path, std::string &error) const
{
    return du::openInExplorer(path, error);
}

void AnalysisService::waitForIdle()
{
    tasks.waitIdle();
}

nlohmann::json toJson(const SizeUpdate &update)
{
    return nlohmann::json{{"path", update.path}, {"size", update.size}, {"file_count", update.fileCount}};
}

nlohmann::json toJson(const FileNode &node)
{
    nlohmann::json json = {
        {"name", node.name},
        {"path", node.path},
        {"size", nullptr},
        {"base_size", node.baseSize},
        {"is_dir", node.isDirectory},
        {"file_count", node.fileCount},
        {"children", nullptr},
    };
    if (node.size)
        json["size"] = *node.size;
    if (node.children)
    {
        nlohmann::json children = nlohmann::json::array();
        for (const auto &child : *node.children)
            children.push_back(toJson(child));
        json["children"] = std::move(children);
    }
    return json;
}

} // namespace fsz::du
