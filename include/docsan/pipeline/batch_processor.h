// =============================================================================
// docsan - Batch Processor
// =============================================================================
// Encodes independent documents in parallel with Intel TBB.
//
// The detector is acquired once for the whole batch through a DetectorScope and
// shared read-only by all tasks. Each document gets its own EncodeSession; a
// failing document yields an error Result and does not stop the batch.
// =============================================================================

#ifndef DOCSAN_PIPELINE_BATCH_PROCESSOR_H
#define DOCSAN_PIPELINE_BATCH_PROCESSOR_H

#include <cstddef>
#include <filesystem>
#include <span>
#include <vector>

#include "docsan/common/error.h"
#include "docsan/detect/detector.h"
#include "docsan/pipeline/encode_session.h"

namespace docsan::pipeline {

struct BatchOptions {
    /// @brief Worker threads (0 = TBB default).
    std::size_t threads = 0;

    /// @brief Replace existing outputs.
    bool overwrite = false;

    /// @brief Run the forward pass without writing anything.
    bool dryRun = false;
};

/// @brief One document of a batch.
struct BatchJob {
    std::filesystem::path input;

    /// @brief Sanitized text destination ("-" for stdout).
    std::filesystem::path sanitizedOutput;

    std::filesystem::path mappingOutput;
};

struct BatchItemResult {
    BatchJob job;
    Result<EncodeStats> outcome;
};

struct BatchSummary {
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t entities = 0;
    std::size_t occurrences = 0;

    /// @brief Error code of the first failed document in job order.
    ErrorCode firstError = ErrorCode::kSuccess;
};

class BatchProcessor {
public:
    BatchProcessor(EncodeOptions encodeOptions, BatchOptions batchOptions);

    /// @brief Encode every job; results are returned in job order.
    /// @throws DetectorUnavailableError if the detector cannot be prepared.
    [[nodiscard]] std::vector<BatchItemResult> run(std::span<const BatchJob> jobs,
                                                   detect::Detector& detector) const;

    /// @brief Encode one document with an already prepared detector.
    [[nodiscard]] EncodeStats processOne(const BatchJob& job, const detect::Detector& detector) const;

    [[nodiscard]] static BatchSummary summarize(std::span<const BatchItemResult> results);

private:
    EncodeOptions encodeOptions_;
    BatchOptions batchOptions_;
};

}  // namespace docsan::pipeline

#endif  // DOCSAN_PIPELINE_BATCH_PROCESSOR_H
