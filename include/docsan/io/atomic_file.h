// =============================================================================
// docsan - Atomic File Writer
// =============================================================================
// Writes an output file so that readers only ever see a complete file:
//   1. write everything to "<path>.<pid>.<n>.tmp"
//   2. flush and close
//   3. rename the temporary file onto "<path>"
// Each writer gets its own temporary file, so concurrent writers of the same
// output never interleave; the last commit wins.
// A writer that is destroyed or interrupted (SIGINT/SIGTERM) before commit()
// removes its temporary file.
// =============================================================================

#ifndef DOCSAN_IO_ATOMIC_FILE_H
#define DOCSAN_IO_ATOMIC_FILE_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <span>
#include <string_view>

namespace docsan::io {

/// @brief Suffix of temporary files created by AtomicFileWriter.
inline constexpr std::string_view kTempSuffix = ".tmp";

class AtomicFileWriter {
public:
    /// @brief Open a temporary sibling of @p outputPath for writing.
    /// @param overwrite Allow replacing an existing output file.
    /// @throws IOError (kFileExists) if the output exists and !overwrite.
    /// @throws IOError if the temporary file cannot be created.
    explicit AtomicFileWriter(std::filesystem::path outputPath, bool overwrite = false);

    /// @brief Removes the temporary file unless commit() succeeded.
    ~AtomicFileWriter();

    AtomicFileWriter(const AtomicFileWriter&) = delete;
    AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;
    AtomicFileWriter(AtomicFileWriter&&) = delete;
    AtomicFileWriter& operator=(AtomicFileWriter&&) = delete;

    /// @brief Append bytes to the temporary file.
    void write(std::span<const std::uint8_t> data);

    /// @brief Append text to the temporary file.
    void write(std::string_view text);

    /// @brief Flush, close and rename into place.
    /// @throws IOError on flush or rename failure (temporary file removed).
    void commit();

    /// @brief Discard the temporary file. Safe to call from a signal handler.
    void abort() noexcept;

    [[nodiscard]] bool committed() const noexcept { return committed_; }

    [[nodiscard]] const std::filesystem::path& tempPath() const noexcept { return tempPath_; }

private:
    void writeBytes(const char* data, std::size_t size);
    void cleanupTempFile() noexcept;

    std::filesystem::path outputPath_;
    std::filesystem::path tempPath_;
    std::ofstream stream_;
    std::mutex mutex_;
    bool committed_ = false;
    std::atomic<bool> aborted_{false};
};

/// @brief Install SIGINT/SIGTERM handlers that abort live writers.
/// @note Idempotent; called by the first AtomicFileWriter.
void installSignalHandlers();

}  // namespace docsan::io

#endif  // DOCSAN_IO_ATOMIC_FILE_H
