#include "file-util.hpp"
#include "utils/common_path.hpp"
#include <iostream>

namespace {

const char* levelName(EventSystem::ILogger::Level level) {
    switch (level) {
        case EventSystem::ILogger::Level::Debug: return "debug";
        case EventSystem::ILogger::Level::Info: return "info";
        case EventSystem::ILogger::Level::Warning: return "warn";
        case EventSystem::ILogger::Level::Error: return "error";
        case EventSystem::ILogger::Level::Critical: return "fatal";
    }
    return "info";
}

} // namespace

fileutil::plugin::EventBusLogger::EventBusLogger(std::weak_ptr<EventSystem::EventDispatcher> bus,
                                                 const FileUtilOptions& options)
    : bus_(std::move(bus)), options_(options) {}

void fileutil::plugin::EventBusLogger::log(Level level, const std::string& message) noexcept {
    auto bus = bus_.lock();
    if (!bus || options_.logEvent.empty()) {
        return;
    }

    try {
        LogMessage payload{levelName(level), message};
        bus->dispatch(options_.logEvent, payload);
    } catch (const std::exception& e) {
        std::cerr << "[file-util] log event dropped: " << e.what() << std::endl;
    }
}

template<typename Payload>
void fileutil::plugin::FileUtilPlugin::bind(const std::string& suffix, void (FileUtilPlugin::*handler)(Payload&)) {
    const EventSystem::HandlerId id = bus_->subscribe<Payload, FileUtilPlugin>(topic(suffix), shared_from_this(), handler);
    subscriptions_.emplace_back(bus_.get(), id);
}

void fileutil::plugin::FileUtilPlugin::onPluginLoad(std::shared_ptr<EventSystem::EventDispatcher> bus,
                                                    const nlohmann::json& pluginOptions) {
    if (!bus) {
        throw EventSystem::InvalidArgumentException("file-util plugin needs an event bus");
    }
    onPluginUnload();

    if (!pluginOptions.is_null()) {
        engine_.setOptions(pluginOptions);
        auto prepend = pluginOptions.find("eventPrepend");
        if (prepend != pluginOptions.end() && prepend->is_string()) {
            eventPrepend_ = prepend->get<std::string>();
        }
    }

    bus_ = std::move(bus);
    engine_.setNotificationSink(std::make_shared<EventBusLogger>(bus_, engine_.options()));

    bind("util:file:hydrate:glob", &FileUtilPlugin::onHydrateGlob);
    bind("util:file:archive:create", &FileUtilPlugin::onArchiveCreate);
    bind("util:file:archive:finalize", &FileUtilPlugin::onArchiveFinalize);
    bind("util:file:copy", &FileUtilPlugin::onCopy);
    bind("util:file:get:options", &FileUtilPlugin::onGetOptions);
    bind("util:file:read:lines", &FileUtilPlugin::onReadLines);
    bind("util:file:set:options", &FileUtilPlugin::onSetOptions);
    bind("util:file:write", &FileUtilPlugin::onWrite);
    bind("util:file:common:path", &FileUtilPlugin::onCommonPath);
    bind("util:file:common:mapped:path", &FileUtilPlugin::onCommonMappedPath);
    bind("util:file:empty:relative:path", &FileUtilPlugin::onEmptyDirectory);
}

void fileutil::plugin::FileUtilPlugin::onPluginUnload() {
    subscriptions_.clear();
    engine_.setNotificationSink(nullptr);
    bus_.reset();
}

std::string fileutil::plugin::FileUtilPlugin::topic(const std::string& suffix) const {
    return eventPrepend_ + ":" + suffix;
}

void fileutil::plugin::FileUtilPlugin::onHydrateGlob(HydrateGlobCommand& command) {
    command.result = engine_.hydrateGlob(command.globs);
}

void fileutil::plugin::FileUtilPlugin::onArchiveCreate(ArchiveCreateCommand& command) {
    auto session = engine_.archiveCreate(command.filePath, command.addToParent, command.silent);
    command.logicalPath = session->getLogicalPath();
}

void fileutil::plugin::FileUtilPlugin::onArchiveFinalize(ArchiveFinalizeCommand& command) {
    command.completion = engine_.archiveFinalize(command.silent);
}

void fileutil::plugin::FileUtilPlugin::onCopy(CopyCommand& command) {
    engine_.copy(command.srcPath, command.destPath, command.silent);
}

void fileutil::plugin::FileUtilPlugin::onGetOptions(OptionsCommand& command) {
    command.options = engine_.getOptions();
}

void fileutil::plugin::FileUtilPlugin::onReadLines(ReadLinesCommand& command) {
    command.lines = engine_.readLines(command.filePath, command.lineStart, command.lineEnd);
}

void fileutil::plugin::FileUtilPlugin::onSetOptions(OptionsCommand& command) {
    engine_.setOptions(command.options);
}

void fileutil::plugin::FileUtilPlugin::onWrite(WriteCommand& command) {
    engine_.writeFile(command.fileData, command.filePath, command.silent, command.encoding);
}

void fileutil::plugin::FileUtilPlugin::onCommonPath(CommonPathCommand& command) {
    command.result = fileutil::commonPath(command.paths);
}

void fileutil::plugin::FileUtilPlugin::onCommonMappedPath(CommonMappedPathCommand& command) {
    command.result = fileutil::commonMappedPath(command.key, command.records);
}

void fileutil::plugin::FileUtilPlugin::onEmptyDirectory(EmptyDirectoryCommand& command) {
    command.emptied = engine_.emptyDirectory();
}

std::shared_ptr<fileutil::plugin::FileUtilPlugin>
fileutil::plugin::onPluginLoad(std::shared_ptr<EventSystem::EventDispatcher> bus,
                               const nlohmann::json& pluginOptions) {
    auto plugin = std::make_shared<FileUtilPlugin>();
    plugin->onPluginLoad(std::move(bus), pluginOptions);
    return plugin;
}
