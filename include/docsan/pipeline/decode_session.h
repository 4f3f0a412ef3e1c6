// =============================================================================
// docsan - Decode Session
// =============================================================================
// Reverse pass for one AI-modified text against a loaded mapping artifact.
//
//   kMappingLoaded -> kRestored
//
// Unresolved placeholders and a fingerprint mismatch are reported, never
// fatal. The mapping itself is read-only.
// =============================================================================

#ifndef DOCSAN_PIPELINE_DECODE_SESSION_H
#define DOCSAN_PIPELINE_DECODE_SESSION_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "docsan/algo/substitution_engine.h"
#include "docsan/format/mapping.h"

namespace docsan::pipeline {

struct DecodeOptions {
    algo::TolerancePolicy tolerance;

    /// @brief Remove a legend block before restoring.
    bool stripLegend = false;
};

enum class DecodeState : std::uint8_t {
    kMappingLoaded = 0,
    kRestored,
    kFailed
};

[[nodiscard]] std::string_view decodeStateToString(DecodeState state) noexcept;

/// @brief Outcome of comparing an original document with the mapping's source fingerprint.
enum class FingerprintCheck : std::uint8_t {
    kNotChecked = 0,
    kMatch,
    kMismatch
};

[[nodiscard]] std::string_view fingerprintCheckToString(FingerprintCheck check) noexcept;

struct DecodeReport {
    std::string restored;

    /// @brief Unmatched placeholder occurrences in text order.
    std::vector<algo::UnresolvedToken> unresolved;

    std::size_t resolvedCount = 0;

    FingerprintCheck fingerprint = FingerprintCheck::kNotChecked;

    /// @brief Bare-token matching was requested but refused for this mapping.
    bool bareTokensRefused = false;

    [[nodiscard]] bool complete() const noexcept { return unresolved.empty(); }
};

class DecodeSession {
public:
    explicit DecodeSession(format::MappingArtifact mapping, DecodeOptions options = {});

    /// @brief Load the mapping artifact from disk.
    /// @throws MappingFileError if the artifact is missing or invalid.
    /// @throws IOError if the artifact exists but cannot be read.
    [[nodiscard]] static DecodeSession load(const std::filesystem::path& mappingPath,
                                            DecodeOptions options = {});

    /// @brief Restore @p text.
    /// @param original Optional original document, checked against the source fingerprint.
    [[nodiscard]] DecodeReport run(std::string_view text,
                                   std::optional<std::string_view> original = std::nullopt);

    [[nodiscard]] DecodeState state() const noexcept { return state_; }

    [[nodiscard]] const format::MappingArtifact& mapping() const noexcept { return mapping_; }

private:
    format::MappingArtifact mapping_;
    DecodeOptions options_;
    DecodeState state_ = DecodeState::kMappingLoaded;
};

}  // namespace docsan::pipeline

#endif  // DOCSAN_PIPELINE_DECODE_SESSION_H
