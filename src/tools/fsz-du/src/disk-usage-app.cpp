#include "analysis_service.hpp"
#include "disk_usage_core.hpp"
#include "disk_usage_options.hpp"
#include "listing_model.hpp"

#define Uses_TApplication
#define Uses_TDeskTop
#define Uses_TDialog
#define Uses_TKeys
#define Uses_TInputLine
#define Uses_TLabel
#define Uses_TButton
#define Uses_TListViewer
#define Uses_TColorAttr
#define Uses_TDrawBuffer
#define Uses_TEvent
#define Uses_TMenuBar
#define Uses_TMenuItem
#define Uses_TScrollBar
#define Uses_TStatusDef
#define Uses_TStatusItem
#define Uses_TStatusLine
#define Uses_TSubMenu
#define Uses_TView
#define Uses_TWindow
#define Uses_MsgBox
#include <tvision/tv.h>

#include "fsz/commands/fsz_du.hpp"
#include "fsz/logging.hpp"
#include "fsz/options.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits.h>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#ifndef FSZ_DU_VERSION
#define FSZ_DU_VERSION "0.0.0"
#endif

using namespace fsz::du;
namespace config = fsz::config;
namespace commands = fsz::commands::disk_usage;

static constexpr const char *kToolId = "fsz-du";

static constexpr unsigned short cmReveal = commands::RevealInFileManager;
static constexpr unsigned short cmParentFolder = commands::ParentFolder;
static constexpr unsigned short cmRefreshFolder = commands::RefreshFolder;
static constexpr unsigned short cmAbout = commands::About;
static constexpr unsigned short cmUnitAuto = commands::UnitAuto;
static constexpr unsigned short cmUnitBytes = commands::UnitBytes;
static constexpr unsigned short cmUnitKB = commands::UnitKB;
static constexpr unsigned short cmUnitMB = commands::UnitMB;
static constexpr unsigned short cmUnitGB = commands::UnitGB;
static constexpr unsigned short cmUnitTB = commands::UnitTB;

namespace
{

// Collects updates from worker threads until the UI thread drains them in idle().
class QueuedUpdateSink : public SizeUpdateSink
{
public:
    void notify(const SizeUpdate &update) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        pending.push_back(update);
    }

    std::vector<SizeUpdate> drain()
    {
        std::vector<SizeUpdate> drained;
        std::lock_guard<std::mutex> lock(mutex);
        drained.swap(pending);
        return drained;
    }

private:
    std::mutex mutex;
    std::vector<SizeUpdate> pending;
};

std::string fileCountText(std::uint64_t count)
{
    return std::to_string(count) + (count == 1 ? " file" : " files");
}

} // namespace

class FolderSizeApp;
class FolderWindow;

class FolderHeaderView : public TView
{
public:
    FolderHeaderView(const TRect &bounds, FolderWindow &owner);

    virtual void draw() override;

private:
    FolderWindow &ownerWindow;
};

class FolderListView : public TListViewer
{
public:
    FolderListView(const TRect &bounds, TScrollBar *v, FolderWindow &owner);

    virtual void getText(char *dest, short item, short maxLen) override;
    virtual void handleEvent(TEvent &event) override;
    virtual void selectItem(short item) override;

    void refreshRange();
    const FileNode *currentEntry() const;

private:
    std::string formatRow(const FileNode &node) const;

    FolderWindow &ownerWindow;
};

class FolderWindow : public TWindow
{
public:
    FolderWindow(FolderSizeApp &app, FileNode listing);
    ~FolderWindow();

    const FileNode &listing() const { return current; }
    SizeUnit unit() const;

    bool applyUpdates(const std::vector<SizeUpdate> &updates);
    void navigateTo(const std::string &path);
    void navigateUp();
    void reload();
    void revealFocused();
    void refresh();

private:
    FolderSizeApp &app;
    FileNode current;
    FolderHeaderView *header = nullptr;
    FolderListView *listView = nullptr;
};

class FolderSizeApp : public TApplication
{
public:
    FolderSizeApp(const std::vector<std::string> &paths, AnalysisSettings settings);
    ~FolderSizeApp();

    virtual void handleEvent(TEvent &event) override;
    virtual void idle() override;

    static TMenuBar *initMenuBar(TRect r);
    static TStatusLine *initStatusLine(TRect r);

    AnalysisService &analysis() { return service; }
    SizeUnit unit() const { return currentUnit; }

    void openFolder(const std::string &path);
    void registerWindow(FolderWindow *window);
    void unregisterWindow(FolderWindow *window);

private:
    void promptOpenDirectory();
    void applyUnit(SizeUnit unit);
    FolderWindow *activeFolderWindow();

    QueuedUpdateSink updates;
    AnalysisService service;
    std::vector<FolderWindow *> windows;
    SizeUnit currentUnit = SizeUnit::Auto;
    int openedCount = 0;
};

FolderHeaderView::FolderHeaderView(const TRect &bounds, FolderWindow &owner)
    : TView(bounds), ownerWindow(owner)
{
    options &= ~(ofSelectable | ofFirstClick);
}

void FolderHeaderView::draw()
{
    const FileNode &listing = ownerWindow.listing();
    const SizeUnit unit = ownerWindow.unit();
    TColorAttr color = getColor(1);

    std::string summaryText;
    if (listing.size)
    {
        summaryText = "Total " + formatSize(*listing.size, unit) + " in " + fileCountText(listing.fileCount);
    }
    else
    {
        ListingSummary summary = summarizeListing(listing);
        summaryText = "Scanning... " + formatSize(summary.partialSize, unit) + " so far in " +
                      fileCountText(summary.partialFileCount);
        if (!summary.hasPending)
            summaryText += ", finishing";
    }
    summaryText += "  (direct files " + formatSize(listing.baseSize, unit) + ")";

    const std::string lines[2] = {listing.path, summaryText};
    for (int y = 0; y < size.y && y < 2; ++y)
    {
        TDrawBuffer buffer;
        buffer.moveChar(0, ' ', color, size.x);
        buffer.moveStr(0, lines[y].c_str(), color, size.x);
        writeLine(0, y, size.x, 1, buffer);
    }
}

FolderListView::FolderListView(const TRect &bounds, TScrollBar *v, FolderWindow &owner)
    : TListViewer(bounds, 1, nullptr, v), ownerWindow(owner)
{
    refreshRange();
}

void FolderListView::refreshRange()
{
    const auto &children = ownerWindow.listing().children;
    setRange(children ? static_cast<short>(children->size()) : 0);
    drawView();
}

const FileNode *FolderListView::currentEntry() const
{
    const auto &children = ownerWindow.listing().children;
    if (!children || focused < 0 || static_cast<std::size_t>(focused) >= children->size())
        return nullptr;
    return &(*children)[static_cast<std::size_t>(focused)];
}

std::string FolderListView::formatRow(const FileNode &node) const
{
    static constexpr int kSizeWidth = 12;
    static constexpr int kCountWidth = 14;
    int nameWidth = std::max(10, size.x - kSizeWidth - kCountWidth - 4);

    std::string name = node.isDirectory ? node.name + "/" : node.name;
    if (static_cast<int>(name.size()) > nameWidth)
        name = name.substr(0, static_cast<std::size_t>(nameWidth - 1)) + "~";

    std::string sizeText = node.size ? formatSize(*node.size, ownerWindow.unit()) : std::string("calculating");
    std::string countText = node.isDirectory && !node.size ? std::string() : fileCountText(node.fileCount);

    std::ostringstream line;
    line << std::left << std::setw(nameWidth) << name << "  ";
    line << std::right << std::setw(kSizeWidth) << sizeText << "  ";
    line << std::right << std::setw(kCountWidth) << countText;
    return line.str();
}

void FolderListView::getText(char *dest, short item, short maxLen)
{
    const auto &children = ownerWindow.listing().children;
    if (!children || item < 0 || static_cast<std::size_t>(item) >= children->size())
    {
        *dest = '\0';
        return;
    }

    std::string text = formatRow((*children)[static_cast<std::size_t>(item)]);
    if (text.size() >= static_cast<std::size_t>(maxLen))
        text.resize(maxLen - 1);
    std::snprintf(dest, maxLen, "%s", text.c_str());
}

void FolderListView::handleEvent(TEvent &event)
{
    if (event.what == evKeyDown && event.keyDown.keyCode == kbEnter)
    {
        clearEvent(event);
        selectItem(focused);
        return;
    }
    if (event.what == evKeyDown && event.keyDown.keyCode == kbBack)
    {
        clearEvent(event);
        ownerWindow.navigateUp();
        return;
    }
    if (event.what == evKeyDown && (event.keyDown.charScan.charCode == 'o' || event.keyDown.charScan.charCode == 'O'))
    {
        clearEvent(event);
        ownerWindow.revealFocused();
        return;
    }
    TListViewer::handleEvent(event);
}

void FolderListView::selectItem(short item)
{
    const auto &children = ownerWindow.listing().children;
    if (!children || item < 0 || static_cast<std::size_t>(item) >= children->size())
        return;
    const FileNode &entry = (*children)[static_cast<std::size_t>(item)];
    if (!entry.isDirectory)
        return;
    std::string target = entry.path;
    ownerWindow.navigateTo(target);
}

FolderWindow::FolderWindow(FolderSizeApp &appRef, FileNode listing)
    : TWindowInit(&TWindow::initFrame),
      TWindow(TRect(0, 0, 78, 20), "Folder Size", wnNoNumber),
      app(appRef), current(std::move(listing))
{
    flags |= wfGrow;
    growMode = gfGrowHiX | gfGrowHiY;

    TRect client = getExtent();
    client.grow(-1, -1);

    header = new FolderHeaderView(TRect(client.a.x, client.a.y, client.b.x, client.a.y + 2), *this);
    header->growMode = gfGrowHiX;

    auto *vScroll = new TScrollBar(TRect(client.b.x - 1, client.a.y + 2, client.b.x, client.b.y));
    vScroll->growMode = gfGrowLoX | gfGrowHiX | gfGrowHiY;

    listView = new FolderListView(TRect(client.a.x, client.a.y + 2, client.b.x - 1, client.b.y), vScroll, *this);
    listView->growMode = gfGrowHiX | gfGrowHiY;

    insert(header);
    insert(vScroll);
    insert(listView);
    app.registerWindow(this);
}

FolderWindow::~FolderWindow()
{
    app.unregisterWindow(this);
}

SizeUnit FolderWindow::unit() const
{
    return app.unit();
}

bool FolderWindow::applyUpdates(const std::vector<SizeUpdate> &updates)
{
    return applySizeUpdates(current, updates) != 0;
}

void FolderWindow::navigateTo(const std::string &path)
{
    current = app.analysis().analyzeDirectory(path);
    listView->focusItem(0);
    refresh();
}

void FolderWindow::navigateUp()
{
    std::filesystem::path here(current.path);
    std::filesystem::path parent = here.parent_path();
    if (parent.empty() || parent == here)
        return;
    navigateTo(parent.string());
}

void FolderWindow::reload()
{
    navigateTo(current.path);
}

void FolderWindow::revealFocused()
{
    const FileNode *entry = listView->currentEntry();
    std::string target = entry ? entry->path : current.path;
    std::string error;
    if (!app.analysis().openInExplorer(target, error))
        messageBox(error.c_str(), mfError | mfOKButton);
}

void FolderWindow::refresh()
{
    listView->refreshRange();
    header->drawView();
}

FolderSizeApp::FolderSizeApp(const std::vector<std::string> &paths, AnalysisSettings settings)
    : TProgInit(&FolderSizeApp::initStatusLine, &FolderSizeApp::initMenuBar, &TApplication::initDeskTop),
      service(updates, settings)
{
    for (const auto &path : paths)
        openFolder(path);
}

FolderSizeApp::~FolderSizeApp()
{
    // Windows unregister themselves from this object while the desktop is torn down.
    shutDown();
    if (service.inProgress().size() > 0)
        fsz::log::logger()->info("waiting for {} running size computations", service.inProgress().size());
}

void FolderSizeApp::handleEvent(TEvent &event)
{
    TApplication::handleEvent(event);
    if (event.what != evCommand)
        return;

    FolderWindow *window = activeFolderWindow();
    switch (event.message.command)
    {
    case cmOpen:
        promptOpenDirectory();
        break;
    case cmReveal:
        if (window)
            window->revealFocused();
        break;
    case cmParentFolder:
        if (window)
            window->navigateUp();
        break;
    case cmRefreshFolder:
        if (window)
            window->reload();
        break;
    case cmUnitAuto:
        applyUnit(SizeUnit::Auto);
        break;
    case cmUnitBytes:
        applyUnit(SizeUnit::Bytes);
        break;
    case cmUnitKB:
        applyUnit(SizeUnit::Kilobytes);
        break;
    case cmUnitMB:
        applyUnit(SizeUnit::Megabytes);
        break;
    case cmUnitGB:
        applyUnit(SizeUnit::Gigabytes);
        break;
    case cmUnitTB:
        applyUnit(SizeUnit::Terabytes);
        break;
    case cmAbout:
    {
        std::string text = std::string("\003") + kToolId + " " + FSZ_DU_VERSION +
                           "\n\n\003Incremental folder size analysis";
        messageBox(text.c_str(), mfInformation | mfOKButton);
        break;
    }
    default:
        return;
    }
    clearEvent(event);
}

void FolderSizeApp::idle()
{
    TApplication::idle();

    std::vector<SizeUpdate> drained = updates.drain();
    if (drained.empty())
        return;

    for (FolderWindow *window : windows)
    {
        if (window->applyUpdates(drained))
            window->refresh();
    }
}

TMenuBar *FolderSizeApp::initMenuBar(TRect r)
{
    r.b.y = r.a.y + 1;
    TSubMenu &fileMenu = *new TSubMenu("~F~ile", hcNoContext) +
                         *new TMenuItem("~O~pen Directory...", cmOpen, kbF3, hcNoContext, "F3") +
                         *new TMenuItem("~R~eveal in File Manager", cmReveal, kbF4, hcNoContext, "F4") +
                         *new TMenuItem("~C~lose", cmClose, kbAltF3, hcNoContext, "Alt-F3") +
                         newLine() +
                         *new TMenuItem("E~x~it", cmQuit, kbAltX, hcNoContext, "Alt-X");

    TSubMenu &viewMenu = *new TSubMenu("~V~iew", hcNoContext) +
                         *new TMenuItem("~P~arent Folder", cmParentFolder, kbNoKey, hcNoContext, "Bksp") +
                         *new TMenuItem("Re~f~resh", cmRefreshFolder, kbF5, hcNoContext, "F5");

    TSubMenu &unitMenu = *new TSubMenu("~U~nits", hcNoContext) +
                         *new TMenuItem("~A~uto", cmUnitAuto, kbNoKey, hcNoContext) +
                         *new TMenuItem("~B~ytes", cmUnitBytes, kbNoKey, hcNoContext) +
                         *new TMenuItem("~K~ilobytes", cmUnitKB, kbNoKey, hcNoContext) +
                         *new TMenuItem("~M~egabytes", cmUnitMB, kbNoKey, hcNoContext) +
                         *new TMenuItem("~G~igabytes", cmUnitGB, kbNoKey, hcNoContext) +
                         *new TMenuItem("~T~erabytes", cmUnitTB, kbNoKey, hcNoContext);

    TSubMenu &helpMenu = *new TSubMenu("~H~elp", hcNoContext) +
                         *new TMenuItem("~A~bout", cmAbout, kbNoKey, hcNoContext);

    return new TMenuBar(r, fileMenu + viewMenu + unitMenu + helpMenu);
}

TStatusLine *FolderSizeApp::initStatusLine(TRect r)
{
    r.a.y = r.b.y - 1;
    return new TStatusLine(r, *new TStatusDef(0, 0xFFFF) +
                                  *new TStatusItem("~Alt-X~ Exit", kbAltX, cmQuit) +
                                  *new TStatusItem("~F3~ Open", kbF3, cmOpen) +
                                  *new TStatusItem("~F4~ Reveal (o)", kbF4, cmReveal) +
                                  *new TStatusItem("~F5~ Refresh", kbF5, cmRefreshFolder) +
                                  *new TStatusItem("~Enter~ Descend", kbNoKey, 0) +
                                  *new TStatusItem("~Bksp~ Up", kbNoKey, 0));
}

void FolderSizeApp::openFolder(const std::string &path)
{
    auto *window = new FolderWindow(*this, service.analyzeDirectory(path));
    int offset = (openedCount++ % 8) * 2;
    window->moveTo(offset, offset);
    deskTop->insert(window);
}

void FolderSizeApp::registerWindow(FolderWindow *window)
{
    windows.push_back(window);
}

void FolderSizeApp::unregisterWindow(FolderWindow *window)
{
    windows.erase(std::remove(windows.begin(), windows.end(), window), windows.end());
}

void FolderSizeApp::promptOpenDirectory()
{
    struct DialogData
    {
        char path[PATH_MAX];
    } data{};

    std::error_code ec;
    std::string start = std::filesystem::current_path(ec).string();
    std::snprintf(data.path, sizeof(data.path), "%s", start.c_str());

    TDialog *d = new TDialog(TRect(0, 0, 60, 10), "Open Directory");
    d->options |= ofCentered;
    auto *input = new TInputLine(TRect(3, 3, 55, 4), sizeof(data.path) - 1);
    d->insert(input);
    d->insert(new TLabel(TRect(2, 2, 20, 3), "~P~ath:", input));
    d->insert(new TButton(TRect(15, 6, 25, 8), "O~K~", cmOK, bfDefault));
    d->insert(new TButton(TRect(27, 6, 37, 8), "Cancel", cmCancel, bfNormal));

    if (TProgram::application->executeDialog(d, &data) != cmCancel)
        openFolder(data.path);
}

void FolderSizeApp::applyUnit(SizeUnit unit)
{
    currentUnit = unit;
    for (FolderWindow *window : windows)
        window->refresh();
}

FolderWindow *FolderSizeApp::activeFolderWindow()
{
    return dynamic_cast<FolderWindow *>(deskTop->current);
}

int main(int argc, char **argv)
{
    config::OptionRegistry registry(kToolId);
    registerDiskUsageOptions(registry);

    bool loadDefaults = true;
    std::vector<std::filesystem::path> optionFiles;
    std::vector<std::string> directories;
    std::vector<std::pair<std::string, std::string>> cliOverrides;

    auto printUsage = []() {
        std::cout << kToolId << " - Incremental folder size analysis\n\n"
                  << "Usage: " << kToolId << " [options] [paths...]\n"
                  << "  --threads N            Limit parallel size workers (0 = all cores)\n"
                  << "  --log-file FILE        Write the log to FILE\n"
                  << "  --log-level LEVEL      trace, debug, info, warn, error, critical or off\n"
                  << "  --load-options FILE    Load options from FILE\n"
                  << "  --no-default-options   Do not load saved defaults\n\n"
                  << "Options may also be set with FSZ_FSZ_DU_<KEY> environment variables." << std::endl;
    };

    auto takeValue = [&](int &i, const std::string &flag, std::string &value) {
        const std::string arg = argv[i];
        const std::string prefix = flag + "=";
        if (arg.rfind(prefix, 0) == 0)
        {
            value = arg.substr(prefix.size());
            return !value.empty();
        }
        if (i + 1 >= argc)
            return false;
        value = argv[++i];
        return true;
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        std::string value;
        if (arg == "--help" || arg == "-h")
        {
            printUsage();
            return 0;
        }
        else if (arg == "--no-default-options")
        {
            loadDefaults = false;
        }
        else if (arg.rfind("--load-options", 0) == 0)
        {
            if (!takeValue(i, "--load-options", value))
            {
                std::cerr << kToolId << ": --load-options requires a file path" << std::endl;
                return 1;
            }
            optionFiles.emplace_back(value);
        }
        else if (arg.rfind("--threads", 0) == 0)
        {
            if (!takeValue(i, "--threads", value))
            {
                std::cerr << kToolId << ": --threads requires a value" << std::endl;
                return 1;
            }
            cliOverrides.emplace_back(kOptionWorkerThreads, value);
        }
        else if (arg.rfind("--log-file", 0) == 0)
        {
            if (!takeValue(i, "--log-file", value))
            {
                std::cerr << kToolId << ": --log-file requires a file path" << std::endl;
                return 1;
            }
            cliOverrides.emplace_back(kOptionLogFile, value);
        }
        else if (arg.rfind("--log-level", 0) == 0)
        {
            if (!takeValue(i, "--log-level", value))
            {
                std::cerr << kToolId << ": --log-level requires a level" << std::endl;
                return 1;
            }
            cliOverrides.emplace_back(kOptionLogLevel, value);
        }
        else if (arg.size() > 1 && arg[0] == '-')
        {
            std::cerr << kToolId << ": unknown option '" << arg << "'" << std::endl;
            return 1;
        }
        else
        {
            directories.push_back(arg);
        }
    }

    if (loadDefaults)
        registry.loadDefaults();
    registry.applyEnvironment();
    for (const auto &file : optionFiles)
    {
        std::string error;
        if (!registry.loadFromFile(file, &error))
        {
            std::cerr << kToolId << ": failed to load options: " << error << std::endl;
            return 1;
        }
    }
    for (const auto &[key, value] : cliOverrides)
        registry.set(key, config::OptionValue(value));

    // The terminal belongs to Turbo Vision, so the log always goes to a file.
    fsz::log::LogSettings logSettings = logSettingsFromRegistry(registry);
    logSettings.console = false;
    if (logSettings.file.empty())
    {
        std::filesystem::path logDir = config::OptionRegistry::configRoot() / kToolId;
        std::error_code ec;
        std::filesystem::create_directories(logDir, ec);
        logSettings.file = logDir / "fsz-du.log";
    }
    fsz::log::initialize(logSettings);

    if (directories.empty())
        directories.emplace_back(".");

    FolderSizeApp app(directories, analysisSettingsFromRegistry(registry));
    app.run();
    return 0;
}
