// =============================================================================
// docsan - Analyze Command Implementation
// =============================================================================

#include "analyze_command.h"

#include <fmt/format.h>

#include "docsan/algo/entity_normalizer.h"
#include "docsan/algo/span_resolver.h"
#include "docsan/common/logger.h"
#include "docsan/io/text_file.h"

namespace docsan::commands {

AnalyzeCommand::AnalyzeCommand(AnalyzeOptions options) : options_(std::move(options)) {}

int AnalyzeCommand::execute() {
    const std::string text = io::readTextFile(options_.inputPath);

    auto detector = detect::createDetectors(options_.detectors, options_.detectorOptions);
    detect::DetectorScope scope(*detector);

    printReport(analyze(text, scope.detector()));
    return 0;
}

AnalyzeReport AnalyzeCommand::analyze(std::string_view text,
                                      const detect::Detector& detector) const {
    algo::SpanResolver resolver(options_.priorities);
    const auto resolved = resolver.resolve(text, detector.scan(text));
    const auto normalized = algo::EntityNormalizer{}.normalize(resolved);

    AnalyzeReport report;
    for (const auto& entity : normalized.entities) {
        auto& findings = report[entity.type];
        ++findings.entities;
        findings.occurrences += entity.occurrences;
        if (findings.examples.size() < options_.maxExamples) {
            findings.examples.push_back(entity.canonical);
        }
    }
    return report;
}

void AnalyzeCommand::printReport(const AnalyzeReport& report) const {
    fmt::print("=== docsan analysis: {} ===\n\n", options_.inputPath.string());
    if (report.empty()) {
        fmt::print("No sensitive values detected.\n");
        return;
    }

    std::size_t totalEntities = 0;
    for (const auto& [type, findings] : report) {
        totalEntities += findings.entities;
        fmt::print("{:<14} {:>5} distinct, {:>5} occurrences\n", type, findings.entities,
                   findings.occurrences);
        for (const auto& example : findings.examples) {
            fmt::print("    {}\n", excerpt(example, 60));
        }
    }
    fmt::print("\n{} distinct values across {} types\n", totalEntities, report.size());
}

}  // namespace docsan::commands
