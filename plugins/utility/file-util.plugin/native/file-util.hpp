#ifndef FILEUTIL_PLUGIN_FILE_UTIL_HPP
#define FILEUTIL_PLUGIN_FILE_UTIL_HPP

#include "utils/event_engine.hpp"
#include "utils/file_engine.hpp"
#include "utils/file_options.hpp"
#include "utils/glob_engine.hpp"
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fileutil {
namespace plugin {

// ----------------- Command payloads -----------------
// Handlers write their results back into the payload they were invoked with.

struct LogMessage {
    std::string level;
    std::string message;
};

struct HydrateGlobCommand {
    nlohmann::json globs;
    HydrateResult result;
};

struct ArchiveCreateCommand {
    std::string filePath;
    bool addToParent = true;
    bool silent = false;
    std::string logicalPath;
};

struct ArchiveFinalizeCommand {
    bool silent = false;
    std::shared_future<void> completion;
};

struct CopyCommand {
    std::string srcPath;
    std::string destPath;
    bool silent = false;
};

// get:options fills options; set:options reads it.
struct OptionsCommand {
    nlohmann::json options = nlohmann::json::object();
};

struct ReadLinesCommand {
    std::string filePath;
    int64_t lineStart = 0;
    int64_t lineEnd = 0;
    std::vector<std::string> lines;
};

struct WriteCommand {
    std::string fileData;
    std::string filePath;
    bool silent = false;
    std::string encoding;
};

struct CommonPathCommand {
    std::vector<std::string> paths;
    std::string result;
};

struct CommonMappedPathCommand {
    std::string key;
    nlohmann::json records = nlohmann::json::array();
    std::string result;
};

struct EmptyDirectoryCommand {
    bool emptied = false;
};

// Forwards engine notifications to the bus as LogMessage on options.logEvent.
class EventBusLogger : public EventSystem::ILogger {
public:
    EventBusLogger(std::weak_ptr<EventSystem::EventDispatcher> bus, const FileUtilOptions& options);

    void log(Level level, const std::string& message) noexcept override;

private:
    std::weak_ptr<EventSystem::EventDispatcher> bus_;
    const FileUtilOptions& options_;
};

/**
 * Exposes FileEngine on an event bus. Every command is bound under
 * "<eventPrepend>:util:file:..." with eventPrepend defaulting to "typhonjs".
 *
 * Must be owned by a std::shared_ptr before onPluginLoad is called; handlers
 * hold it weakly and stop firing once the plugin is gone.
 */
class FileUtilPlugin : public std::enable_shared_from_this<FileUtilPlugin> {
public:
    FileUtilPlugin() = default;
    ~FileUtilPlugin() = default;

    FileUtilPlugin(const FileUtilPlugin&) = delete;
    FileUtilPlugin& operator=(const FileUtilPlugin&) = delete;

    void onPluginLoad(std::shared_ptr<EventSystem::EventDispatcher> bus,
                      const nlohmann::json& pluginOptions = nlohmann::json::object());
    void onPluginUnload();

    std::string topic(const std::string& suffix) const;
    const std::string& eventPrepend() const { return eventPrepend_; }
    FileEngine& engine() { return engine_; }

    void onHydrateGlob(HydrateGlobCommand& command);
    void onArchiveCreate(ArchiveCreateCommand& command);
    void onArchiveFinalize(ArchiveFinalizeCommand& command);
    void onCopy(CopyCommand& command);
    void onGetOptions(OptionsCommand& command);
    void onReadLines(ReadLinesCommand& command);
    void onSetOptions(OptionsCommand& command);
    void onWrite(WriteCommand& command);
    void onCommonPath(CommonPathCommand& command);
    void onCommonMappedPath(CommonMappedPathCommand& command);
    void onEmptyDirectory(EmptyDirectoryCommand& command);

private:
    template<typename Payload>
    void bind(const std::string& suffix, void (FileUtilPlugin::*handler)(Payload&));

    FileEngine engine_;
    std::shared_ptr<EventSystem::EventDispatcher> bus_;
    std::vector<EventSystem::ScopedSubscription> subscriptions_;
    std::string eventPrepend_ = "typhonjs";
};

// Creates a plugin, binds it to bus and returns it. The caller keeps it alive.
std::shared_ptr<FileUtilPlugin> onPluginLoad(std::shared_ptr<EventSystem::EventDispatcher> bus,
                                             const nlohmann::json& pluginOptions = nlohmann::json::object());

} // namespace plugin
} // namespace fileutil

#endif
