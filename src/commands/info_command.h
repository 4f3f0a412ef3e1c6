// =============================================================================
// docsan - Info Command
// =============================================================================
// Command handler for displaying mapping artifact information.
//
// Values are hidden unless explicitly requested; placeholders, types, counts
// and fingerprints are always shown.
// =============================================================================

#ifndef DOCSAN_COMMANDS_INFO_COMMAND_H
#define DOCSAN_COMMANDS_INFO_COMMAND_H

#include <filesystem>
#include <string>
#include <string_view>

#include "docsan/format/mapping.h"

namespace docsan::commands {

// =============================================================================
// Info Options
// =============================================================================

/// @brief Configuration options for info command.
struct InfoOptions {
    /// @brief Input .dsm file path.
    std::filesystem::path inputPath;

    /// @brief Output as JSON.
    bool jsonOutput = false;

    /// @brief Print canonical values and variants.
    bool showValues = false;
};

// =============================================================================
// InfoCommand Class
// =============================================================================

/// @brief Command handler for displaying mapping artifact information.
class InfoCommand {
public:
    /// @brief Construct with options.
    explicit InfoCommand(InfoOptions options);

    /// @brief Execute the info command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Render an artifact as text.
    [[nodiscard]] std::string renderText(const format::MappingArtifact& artifact) const;

    /// @brief Render an artifact as JSON.
    [[nodiscard]] std::string renderJson(const format::MappingArtifact& artifact) const;

private:
    InfoOptions options_;
};

/// @brief Escape a string for a JSON string literal.
[[nodiscard]] std::string jsonEscape(std::string_view text);

}  // namespace docsan::commands

#endif  // DOCSAN_COMMANDS_INFO_COMMAND_H
