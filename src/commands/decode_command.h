// =============================================================================
// docsan - Decode Command
// =============================================================================
// Command handler for restoring original values in AI-modified text.
// =============================================================================

#ifndef DOCSAN_COMMANDS_DECODE_COMMAND_H
#define DOCSAN_COMMANDS_DECODE_COMMAND_H

#include <filesystem>

#include "docsan/pipeline/decode_session.h"

namespace docsan::commands {

struct DecodeCommandOptions {
    /// @brief Text to restore.
    std::filesystem::path inputPath;

    std::filesystem::path mappingPath;

    /// @brief Restored output ("-" for stdout; empty derives "<stem>_restored<ext>").
    std::filesystem::path outputPath;

    /// @brief Original document, checked against the mapping's fingerprint.
    std::filesystem::path sourcePath;

    pipeline::DecodeOptions decode;

    /// @brief Exit non-zero when placeholders remain unresolved.
    bool failOnUnresolved = false;

    bool forceOverwrite = false;
};

class DecodeCommand {
public:
    explicit DecodeCommand(DecodeCommandOptions options);

    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

private:
    void reportUnresolved(const pipeline::DecodeReport& report) const;

    DecodeCommandOptions options_;
};

}  // namespace docsan::commands

#endif  // DOCSAN_COMMANDS_DECODE_COMMAND_H
