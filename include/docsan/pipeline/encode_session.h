// =============================================================================
// docsan - Encode Session
// =============================================================================
// Forward pass for one document. The session is a single-use state machine:
//
//   kRaw -> kSpansResolved -> kEntitiesNormalized -> kPlaceholdersAllocated
//        -> kSanitized -> kMappingPersisted
//
// Any failure moves the session to kFailed. Calling run() or persist() out of
// order throws a DocsanException with ErrorCode::kInvalidState.
//
// Each session owns its allocator counters and entity table, so sessions for
// different documents can run concurrently.
// =============================================================================

#ifndef DOCSAN_PIPELINE_ENCODE_SESSION_H
#define DOCSAN_PIPELINE_ENCODE_SESSION_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "docsan/algo/entity_type.h"
#include "docsan/algo/placeholder.h"
#include "docsan/algo/span_resolver.h"
#include "docsan/common/types.h"
#include "docsan/detect/detector.h"
#include "docsan/format/mapping.h"

namespace docsan::pipeline {

// =============================================================================
// Options
// =============================================================================

struct EncodeOptions {
    algo::Delimiters delimiters;

    /// @brief Overlap priorities (built-in table plus overrides).
    algo::PriorityTable priorities;

    /// @brief Replace undetected occurrences of known variants.
    bool sweepVariants = true;

    /// @brief Shortest value (bytes) considered by the sweep and the leak check.
    std::size_t minSweepLength = kDefaultMinSweepLength;

    /// @brief Fail the document if a value survives into the sanitized text.
    bool checkLeaks = true;

    /// @brief Append a value-free legend block to the sanitized text.
    bool appendLegend = false;
};

// =============================================================================
// State
// =============================================================================

enum class EncodeState : std::uint8_t {
    kRaw = 0,
    kSpansResolved,
    kEntitiesNormalized,
    kPlaceholdersAllocated,
    kSanitized,
    kMappingPersisted,
    kFailed
};

[[nodiscard]] std::string_view encodeStateToString(EncodeState state) noexcept;

// =============================================================================
// Result
// =============================================================================

struct EncodeStats {
    algo::ResolveStats resolve;

    /// @brief Occurrences added by the variant sweep.
    std::size_t swept = 0;

    /// @brief Distinct entities (= placeholders).
    std::size_t entities = 0;

    /// @brief Replaced occurrences.
    std::size_t occurrences = 0;

    /// @brief Resolved spans dropped by normalization (blank values).
    std::size_t discarded = 0;

    /// @brief Source contains bare TYPE_n text for a mapped type.
    bool sourceHasBareTokens = false;

    std::uint64_t sourceBytes = 0;
    std::uint64_t sanitizedBytes = 0;
};

struct EncodeResult {
    std::string sanitized;
    format::MappingArtifact mapping;
    EncodeStats stats;
};

// =============================================================================
// EncodeSession
// =============================================================================

class EncodeSession {
public:
    explicit EncodeSession(EncodeOptions options = {});

    /// @brief Sanitize @p source using precomputed candidate spans.
    /// @throws PlaceholderCollisionError if the source contains a delimiter.
    /// @throws LeakDetectedError if a value survives (checkLeaks).
    /// @throws DocsanException(kInvalidState) if the session was already used.
    [[nodiscard]] EncodeResult run(std::string_view source, std::vector<Span> candidates);

    /// @brief Sanitize @p source with spans from a prepared detector.
    [[nodiscard]] EncodeResult run(std::string_view source, const detect::Detector& detector);

    /// @brief Atomically write the mapping artifact of a finished run.
    /// @throws IOError on write failure (no partial artifact is left behind).
    void persist(const EncodeResult& result, const std::filesystem::path& mappingPath,
                 bool overwrite = false);

    [[nodiscard]] EncodeState state() const noexcept { return state_; }

private:
    EncodeResult runStages(std::string_view source, std::vector<Span> candidates);

    void requireState(EncodeState expected, std::string_view operation) const;

    void advance(EncodeState next);

    EncodeOptions options_;
    EncodeState state_ = EncodeState::kRaw;
};

}  // namespace docsan::pipeline

#endif  // DOCSAN_PIPELINE_ENCODE_SESSION_H
