// =============================================================================
// docsan - Encode Command Implementation
// =============================================================================

#include "encode_command.h"

#include <chrono>
#include <set>

#include <fmt/format.h>

#include "docsan/common/error.h"
#include "docsan/common/logger.h"
#include "docsan/format/mapping_format.h"
#include "docsan/io/text_file.h"

namespace docsan::commands {

namespace {

constexpr std::string_view kSanitizedSuffix = "_sanitized";

}  // namespace

EncodeCommand::EncodeCommand(EncodeCommandOptions options) : options_(std::move(options)) {}

void EncodeCommand::validateOptions() const {
    if (options_.inputPaths.empty()) {
        throw UsageError("at least one input document is required");
    }
    const bool batch = options_.inputPaths.size() > 1;
    if (batch && !options_.outputPath.empty()) {
        throw UsageError("--output accepts a single input; use --output-dir for several inputs");
    }
    if (batch && !options_.mappingPath.empty()) {
        throw UsageError("--mapping accepts a single input; use --output-dir for several inputs");
    }
    // Span offsets belong to one document
    if (batch && !options_.detectorOptions.spansPath.empty()) {
        throw UsageError("--spans accepts a single input; encode each document separately");
    }
    unwrapOrThrow(options_.encode.delimiters.validate());
}

std::vector<pipeline::BatchJob> EncodeCommand::buildJobs() const {
    std::vector<pipeline::BatchJob> jobs;
    jobs.reserve(options_.inputPaths.size());

    std::set<std::filesystem::path> outputs;
    for (const auto& input : options_.inputPaths) {
        pipeline::BatchJob job;
        job.input = input;
        job.sanitizedOutput = !options_.outputPath.empty()
                                  ? options_.outputPath
                                  : io::derivePath(input, kSanitizedSuffix,
                                                   input.extension().string(), options_.outputDir);
        job.mappingOutput = !options_.mappingPath.empty()
                                ? options_.mappingPath
                                : io::derivePath(input, "", format::kMappingExtension,
                                                 options_.outputDir);

        for (const auto* path : {&job.sanitizedOutput, &job.mappingOutput}) {
            if (*path == io::kStdStreamPath) {
                continue;
            }
            if (!outputs.insert(path->lexically_normal()).second) {
                throw UsageError("two inputs map to the same output file: " + path->string());
            }
        }
        jobs.push_back(std::move(job));
    }
    return jobs;
}

int EncodeCommand::execute() {
    validateOptions();
    const auto jobs = buildJobs();

    auto detector = detect::createDetectors(options_.detectors, options_.detectorOptions);

    pipeline::BatchOptions batchOptions;
    batchOptions.threads = options_.threads;
    batchOptions.overwrite = options_.forceOverwrite;
    batchOptions.dryRun = options_.dryRun;

    const auto started = std::chrono::steady_clock::now();
    pipeline::BatchProcessor processor(options_.encode, batchOptions);
    const auto results = processor.run(jobs, *detector);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (options_.showStats) {
        printStats(results);
    }

    const auto summary = pipeline::BatchProcessor::summarize(results);
    DOCSAN_LOG_INFO("Encoded {}/{} documents ({} entities) in {} ms", summary.succeeded,
                    results.size(), summary.entities, elapsed.count());

    return summary.failed == 0 ? 0 : toExitCode(summary.firstError);
}

void EncodeCommand::printStats(std::span<const pipeline::BatchItemResult> results) const {
    for (const auto& item : results) {
        if (!item.outcome) {
            fmt::print(stderr, "{}: failed ({})\n", item.job.input.string(),
                       item.outcome.error().message());
            continue;
        }
        const auto& stats = *item.outcome;
        fmt::print(stderr,
                   "{}:\n"
                   "  candidates:   {} ({} malformed, {} overlapping)\n"
                   "  resolved:     {}\n"
                   "  swept:        {}\n"
                   "  entities:     {}\n"
                   "  occurrences:  {}\n"
                   "  bytes:        {} -> {}\n",
                   item.job.input.string(), stats.resolve.candidates, stats.resolve.malformed,
                   stats.resolve.rejected, stats.resolve.accepted, stats.swept, stats.entities,
                   stats.occurrences, stats.sourceBytes, stats.sanitizedBytes);
        if (stats.sourceHasBareTokens) {
            fmt::print(stderr, "  note:         source contains undelimited TYPE_n text\n");
        }
    }
}

}  // namespace docsan::commands
