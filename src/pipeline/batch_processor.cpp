// =============================================================================
// docsan - Batch Processor Implementation
// =============================================================================

#include "docsan/pipeline/batch_processor.h"

#include <optional>

#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include "docsan/common/logger.h"
#include "docsan/io/text_file.h"

namespace docsan::pipeline {

BatchProcessor::BatchProcessor(EncodeOptions encodeOptions, BatchOptions batchOptions)
    : encodeOptions_(std::move(encodeOptions)), batchOptions_(batchOptions) {}

EncodeStats BatchProcessor::processOne(const BatchJob& job, const detect::Detector& detector) const {
    const std::string source = io::readTextFile(job.input);

    EncodeSession session(encodeOptions_);
    EncodeResult result = session.run(source, detector);

    if (batchOptions_.dryRun) {
        DOCSAN_LOG_INFO("{}: {} entities, {} occurrences (dry run)", job.input.string(),
                        result.stats.entities, result.stats.occurrences);
        return result.stats;
    }

    // Mapping first: sanitized text without its mapping cannot be restored
    session.persist(result, job.mappingOutput, batchOptions_.overwrite);
    if (job.sanitizedOutput == io::kStdStreamPath) {
        io::writeToStdout(result.sanitized);
    } else {
        io::writeTextFile(job.sanitizedOutput, result.sanitized, batchOptions_.overwrite);
    }

    DOCSAN_LOG_INFO("{}: {} entities, {} occurrences -> {}", job.input.string(),
                    result.stats.entities, result.stats.occurrences,
                    job.sanitizedOutput.string());
    return result.stats;
}

std::vector<BatchItemResult> BatchProcessor::run(std::span<const BatchJob> jobs,
                                                 detect::Detector& detector) const {
    detect::DetectorScope scope(detector);

    std::vector<std::optional<Result<EncodeStats>>> outcomes(jobs.size());

    const int concurrency = batchOptions_.threads == 0
                                ? tbb::task_arena::automatic
                                : static_cast<int>(batchOptions_.threads);
    tbb::task_arena arena(concurrency);
    arena.execute([&] {
        tbb::parallel_for(std::size_t{0}, jobs.size(), [&](std::size_t i) {
            outcomes[i] = tryExecute([&] { return processOne(jobs[i], scope.detector()); });
            if (!outcomes[i]->has_value()) {
                DOCSAN_LOG_ERROR("{}: {}", jobs[i].input.string(),
                                 outcomes[i]->error().message());
            }
        });
    });

    std::vector<BatchItemResult> results;
    results.reserve(jobs.size());
    for (std::size_t i = 0; i < jobs.size(); ++i) {
        results.push_back({jobs[i], std::move(*outcomes[i])});
    }
    return results;
}

BatchSummary BatchProcessor::summarize(std::span<const BatchItemResult> results) {
    BatchSummary summary;
    for (const auto& item : results) {
        if (item.outcome) {
            ++summary.succeeded;
            summary.entities += item.outcome->entities;
            summary.occurrences += item.outcome->occurrences;
        } else {
            ++summary.failed;
            if (summary.firstError == ErrorCode::kSuccess) {
                summary.firstError = item.outcome.error().code();
            }
        }
    }
    return summary;
}

}  // namespace docsan::pipeline
