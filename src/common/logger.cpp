// =============================================================================
// docsan - Logger Module Implementation
// =============================================================================

#include "docsan/common/logger.h"

#include <array>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace docsan::log {

namespace {

/// @brief Installed logger; read lock-free by the DOCSAN_LOG_* macros.
std::atomic<quill::Logger*> gLogger{nullptr};

/// @brief Guards backend start/stop.
std::mutex gLifecycleMutex;
bool gBackendRunning = false;

constexpr std::array<quill::LogLevel, 6> kQuillLevels = {
    quill::LogLevel::TraceL1, quill::LogLevel::Debug, quill::LogLevel::Info,
    quill::LogLevel::Warning, quill::LogLevel::Error, quill::LogLevel::Critical,
};

std::vector<std::shared_ptr<quill::Sink>> makeSinks(const Config& config) {
    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (config.enableConsole) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>(
            config.loggerName + "-console"));
    }
    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        fileConfig.set_open_mode('w');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileConfig, quill::FileEventNotifier{}));
    }
    return sinks;
}

}  // namespace

quill::LogLevel toQuillLevel(Level level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    return index < kQuillLevels.size() ? kQuillLevels[index] : quill::LogLevel::Info;
}

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (gBackendRunning) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});
    gBackendRunning = true;

    auto sinks = makeSinks(config);
    if (sinks.empty()) {
        return;
    }
    quill::Logger* created = quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    created->set_log_level(toQuillLevel(config.level));
    gLogger.store(created, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

void flush() {
    if (quill::Logger* current = logger()) {
        current->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (!gBackendRunning) {
        return;
    }
    flush();
    gLogger.store(nullptr, std::memory_order_release);
    quill::Backend::stop();
    gBackendRunning = false;
}

}  // namespace docsan::log
