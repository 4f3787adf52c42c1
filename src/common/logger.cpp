// =============================================================================
// pipeflow - Logging
// =============================================================================

#include "pflow/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace pflow::log {

namespace {

struct LevelName {
    std::string_view name;
    Level level;
};

constexpr std::array<LevelName, 8> kLevelNames{{
    {"trace", Level::kTrace},
    {"debug", Level::kDebug},
    {"info", Level::kInfo},
    {"warning", Level::kWarning},
    {"warn", Level::kWarning},
    {"error", Level::kError},
    {"critical", Level::kCritical},
    {"fatal", Level::kCritical},
}};

// Non-null exactly while logging is on; the macros read it without locking
std::atomic<quill::Logger*> gLogger{nullptr};

// Serializes init() and shutdown()
std::mutex gLifecycleMutex;

std::shared_ptr<quill::Sink> consoleSink() {
    return quill::Frontend::create_or_get_sink<quill::ConsoleSink>("pflow_console");
}

std::shared_ptr<quill::Sink> fileSink(const std::string& path) {
    quill::FileSinkConfig fileConfig;
    fileConfig.set_open_mode('w');
    return quill::Frontend::create_or_get_sink<quill::FileSink>(path, fileConfig,
                                                                quill::FileEventNotifier{});
}

}  // namespace

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Info;
}

Level levelFromString(std::string_view name) noexcept {
    auto sameName = [name](const LevelName& entry) {
        return std::equal(name.begin(), name.end(), entry.name.begin(), entry.name.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) == b;
                          });
    };
    const auto match = std::find_if(kLevelNames.begin(), kLevelNames.end(), sameName);
    return match != kLevelNames.end() ? match->level : Level::kInfo;
}

std::string_view levelToString(Level level) noexcept {
    // The first entry for a level is its canonical name
    for (const LevelName& entry : kLevelNames) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "info";
}

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (!config.logFile.empty()) {
        sinks.push_back(fileSink(config.logFile));
    }
    if (config.enableConsole || sinks.empty()) {
        sinks.push_back(consoleSink());
    }

    quill::Logger* created = quill::Frontend::create_or_get_logger(config.name, std::move(sinks));
    created->set_log_level(toQuillLevel(config.level));
    gLogger.store(created, std::memory_order_release);
}

void init(std::string_view logFile, Level level) {
    Config config;
    config.logFile = std::string(logFile);
    config.level = level;
    init(config);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return logger() != nullptr;
}

void flush() {
    if (quill::Logger* current = logger()) {
        current->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }
    current->flush_log();
    quill::Backend::stop();
}

}  // namespace pflow::log
