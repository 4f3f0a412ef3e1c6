// =============================================================================
// docsan - Analyze Command
// =============================================================================
// Runs the detectors over a document and reports what an encode would replace,
// without writing any file.
// =============================================================================

#ifndef DOCSAN_COMMANDS_ANALYZE_COMMAND_H
#define DOCSAN_COMMANDS_ANALYZE_COMMAND_H

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "docsan/algo/entity_type.h"
#include "docsan/detect/detector_registry.h"

namespace docsan::commands {

struct AnalyzeOptions {
    std::filesystem::path inputPath;

    std::vector<std::string> detectors;

    detect::DetectorOptions detectorOptions;

    algo::PriorityTable priorities;

    /// @brief Example values printed per type.
    std::size_t maxExamples = 5;
};

/// @brief Per-type findings.
struct TypeFindings {
    std::size_t entities = 0;
    std::size_t occurrences = 0;
    std::vector<std::string> examples;
};

using AnalyzeReport = std::map<std::string, TypeFindings, std::less<>>;

class AnalyzeCommand {
public:
    explicit AnalyzeCommand(AnalyzeOptions options);

    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Detect, resolve and group @p text into per-type findings.
    [[nodiscard]] AnalyzeReport analyze(std::string_view text, const detect::Detector& detector) const;

private:
    void printReport(const AnalyzeReport& report) const;

    AnalyzeOptions options_;
};

}  // namespace docsan::commands

#endif  // DOCSAN_COMMANDS_ANALYZE_COMMAND_H
