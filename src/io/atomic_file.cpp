// =============================================================================
// docsan - Atomic File Writer Implementation
// =============================================================================

#include "docsan/io/atomic_file.h"

#include <array>
#include <csignal>
#include <set>
#include <string>

#include <unistd.h>

#include "docsan/common/error.h"
#include "docsan/common/logger.h"

namespace docsan::io {

namespace {

// =============================================================================
// Interrupt Cleanup
// =============================================================================
// Batch encodes keep several writers open at once. On SIGINT/SIGTERM every
// live writer drops its temporary file, then the previous disposition runs.

using SignalHandler = void (*)(int);

struct ChainedSignal {
    int signum;
    SignalHandler previous;
};

std::mutex gRegistryMutex;
std::set<AtomicFileWriter*> gLiveWriters;
std::atomic<bool> gHandlersInstalled{false};
std::array<ChainedSignal, 2> gChained = {{{SIGINT, nullptr}, {SIGTERM, nullptr}}};

void onInterrupt(int signum) {
    {
        std::lock_guard<std::mutex> lock(gRegistryMutex);
        for (auto* writer : gLiveWriters) {
            writer->abort();
        }
        gLiveWriters.clear();
    }

    for (const auto& chained : gChained) {
        if (chained.signum == signum && chained.previous != nullptr &&
            chained.previous != SIG_DFL && chained.previous != SIG_IGN) {
            chained.previous(signum);
            return;
        }
    }
    std::signal(signum, SIG_DFL);
    std::raise(signum);
}

void track(AtomicFileWriter* writer) {
    std::lock_guard<std::mutex> lock(gRegistryMutex);
    gLiveWriters.insert(writer);
}

void untrack(AtomicFileWriter* writer) {
    std::lock_guard<std::mutex> lock(gRegistryMutex);
    gLiveWriters.erase(writer);
}

/// @brief "<output>.<pid>.<n><kTempSuffix>", unique per writer in this process.
std::filesystem::path makeTempPath(const std::filesystem::path& output) {
    static std::atomic<std::uint64_t> sequence{0};
    return output.string() + "." + std::to_string(::getpid()) + "." +
           std::to_string(sequence.fetch_add(1)) + std::string(kTempSuffix);
}

}  // namespace

void installSignalHandlers() {
    if (gHandlersInstalled.exchange(true)) {
        return;
    }
    std::lock_guard<std::mutex> lock(gRegistryMutex);
    for (auto& chained : gChained) {
        chained.previous = std::signal(chained.signum, onInterrupt);
        if (chained.previous == SIG_ERR) {
            DOCSAN_LOG_WARNING("Cannot install handler for signal {}", chained.signum);
            chained.previous = nullptr;
        }
    }
}

// =============================================================================
// AtomicFileWriter
// =============================================================================

AtomicFileWriter::AtomicFileWriter(std::filesystem::path outputPath, bool overwrite)
    : outputPath_(std::move(outputPath)), tempPath_(makeTempPath(outputPath_)) {
    installSignalHandlers();

    std::error_code ec;
    if (!overwrite && std::filesystem::exists(outputPath_, ec)) {
        throw IOError(ErrorCode::kFileExists,
                      "Output file already exists (use --force to overwrite): " +
                          outputPath_.string());
    }

    stream_.open(tempPath_, std::ios::binary | std::ios::trunc);
    if (!stream_.is_open()) {
        throw IOError("cannot create " + tempPath_.string(), ErrorContext(tempPath_.string()));
    }

    track(this);
    DOCSAN_LOG_DEBUG("AtomicFileWriter created: output={}, temp={}", outputPath_.string(),
                     tempPath_.string());
}

AtomicFileWriter::~AtomicFileWriter() {
    untrack(this);
    if (!committed_) {
        abort();
    }
}

void AtomicFileWriter::write(std::span<const std::uint8_t> data) {
    writeBytes(reinterpret_cast<const char*>(data.data()), data.size());
}

void AtomicFileWriter::write(std::string_view text) {
    writeBytes(text.data(), text.size());
}

void AtomicFileWriter::commit() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (committed_) {
        return;
    }
    if (aborted_) {
        throw IOError("Cannot commit aborted write", ErrorContext(outputPath_.string()));
    }

    stream_.flush();
    if (!stream_.good()) {
        cleanupTempFile();
        throw IOError("flush failed", ErrorContext(tempPath_.string()));
    }
    stream_.close();

    std::error_code ec;
    std::filesystem::rename(tempPath_, outputPath_, ec);
    if (ec) {
        cleanupTempFile();
        throw IOError("Failed to rename temporary file to final output", ec,
                      ErrorContext(outputPath_.string()));
    }

    committed_ = true;
    untrack(this);
    DOCSAN_LOG_DEBUG("Committed {}", outputPath_.string());
}

void AtomicFileWriter::abort() noexcept {
    if (!aborted_.exchange(true)) {
        cleanupTempFile();
    }
}

void AtomicFileWriter::writeBytes(const char* data, std::size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (committed_ || aborted_) {
        throw IOError("Write after commit or abort", ErrorContext(outputPath_.string()));
    }
    stream_.write(data, static_cast<std::streamsize>(size));
    if (!stream_.good()) {
        throw IOError("write failed", ErrorContext(tempPath_.string()));
    }
}

void AtomicFileWriter::cleanupTempFile() noexcept {
    if (stream_.is_open()) {
        stream_.close();
    }

    std::error_code ec;
    if (!std::filesystem::remove(tempPath_, ec) && ec) {
        DOCSAN_LOG_WARNING("Cannot remove {}: {}", tempPath_.string(), ec.message());
    }
}

}  // namespace docsan::io
