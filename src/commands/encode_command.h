// =============================================================================
// docsan - Encode Command
// =============================================================================
// Command handler for sanitizing documents.
//
// Each input produces a sanitized text file and a mapping artifact. Several
// inputs run as one parallel batch that shares the detectors.
// =============================================================================

#ifndef DOCSAN_COMMANDS_ENCODE_COMMAND_H
#define DOCSAN_COMMANDS_ENCODE_COMMAND_H

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include "docsan/detect/detector_registry.h"
#include "docsan/pipeline/batch_processor.h"
#include "docsan/pipeline/encode_session.h"

namespace docsan::commands {

// =============================================================================
// Encode Options
// =============================================================================

struct EncodeCommandOptions {
    std::vector<std::filesystem::path> inputPaths;

    /// @brief Sanitized output for a single input ("-" for stdout).
    std::filesystem::path outputPath;

    /// @brief Directory for derived output names.
    std::filesystem::path outputDir;

    /// @brief Mapping artifact for a single input.
    std::filesystem::path mappingPath;

    /// @brief Detector names; empty selects the defaults.
    std::vector<std::string> detectors;

    detect::DetectorOptions detectorOptions;

    pipeline::EncodeOptions encode;

    std::size_t threads = 0;

    bool dryRun = false;

    /// @brief Print per-document statistics to stderr.
    bool showStats = false;

    bool forceOverwrite = false;
};

// =============================================================================
// EncodeCommand Class
// =============================================================================

class EncodeCommand {
public:
    explicit EncodeCommand(EncodeCommandOptions options);

    /// @brief Execute the encode.
    /// @return Exit code (0 = success, else the first failing document's code).
    [[nodiscard]] int execute();

    /// @brief Jobs derived from the options.
    [[nodiscard]] std::vector<pipeline::BatchJob> buildJobs() const;

private:
    /// @throws UsageError on inconsistent options.
    void validateOptions() const;

    void printStats(std::span<const pipeline::BatchItemResult> results) const;

    EncodeCommandOptions options_;
};

}  // namespace docsan::commands

#endif  // DOCSAN_COMMANDS_ENCODE_COMMAND_H
