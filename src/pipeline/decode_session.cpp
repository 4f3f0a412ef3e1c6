// =============================================================================
// docsan - Decode Session Implementation
// =============================================================================

#include "docsan/pipeline/decode_session.h"

#include <format>
#include <system_error>

#include "docsan/algo/legend_generator.h"
#include "docsan/common/error.h"
#include "docsan/common/logger.h"
#include "docsan/format/mapping_reader.h"

namespace docsan::pipeline {

std::string_view decodeStateToString(DecodeState state) noexcept {
    switch (state) {
        case DecodeState::kMappingLoaded:
            return "mapping-loaded";
        case DecodeState::kRestored:
            return "restored";
        case DecodeState::kFailed:
            return "failed";
    }
    return "unknown";
}

std::string_view fingerprintCheckToString(FingerprintCheck check) noexcept {
    switch (check) {
        case FingerprintCheck::kNotChecked:
            return "not-checked";
        case FingerprintCheck::kMatch:
            return "match";
        case FingerprintCheck::kMismatch:
            return "mismatch";
    }
    return "unknown";
}

DecodeSession::DecodeSession(format::MappingArtifact mapping, DecodeOptions options)
    : mapping_(std::move(mapping)), options_(std::move(options)) {}

DecodeSession DecodeSession::load(const std::filesystem::path& mappingPath, DecodeOptions options) {
    std::error_code ec;
    if (!std::filesystem::exists(mappingPath, ec)) {
        throw MappingFileError("mapping file not found", ErrorContext(mappingPath.string()));
    }
    return DecodeSession(format::MappingReader::load(mappingPath), std::move(options));
}

DecodeReport DecodeSession::run(std::string_view text, std::optional<std::string_view> original) {
    if (state_ != DecodeState::kMappingLoaded) {
        throw DocsanException(ErrorCode::kInvalidState,
                              std::format("cannot run a decode session in state '{}'",
                                          decodeStateToString(state_)));
    }

    DecodeReport report;
    const auto& header = mapping_.header();

    if (original) {
        const bool matches = format::fingerprint(*original) == header.sourceFingerprint &&
                             original->size() == header.sourceLength;
        report.fingerprint = matches ? FingerprintCheck::kMatch : FingerprintCheck::kMismatch;
        if (!matches) {
            DOCSAN_LOG_WARNING("Original document does not match the mapping's source fingerprint");
        }
    }

    algo::TolerancePolicy policy = options_.tolerance;
    if (policy.matchBareTokens && header.sourceHasBareTokens()) {
        policy.matchBareTokens = false;
        report.bareTokensRefused = true;
        DOCSAN_LOG_WARNING("Bare-token matching disabled: the source document already contained "
                           "undelimited TYPE_n text");
    }

    std::string stripped;
    if (options_.stripLegend) {
        stripped = algo::LegendGenerator::strip(text);
        text = stripped;
    }

    algo::SubstitutionEngine engine(header.delimiters);
    algo::ReverseResult reversed;
    try {
        reversed = engine.restore(text, mapping_.placeholderTable(), policy);
    } catch (const DocsanException&) {
        state_ = DecodeState::kFailed;
        throw;
    }

    report.restored = std::move(reversed.restored);
    report.unresolved = std::move(reversed.unresolved);
    report.resolvedCount = reversed.resolved;
    state_ = DecodeState::kRestored;

    if (!report.unresolved.empty()) {
        DOCSAN_LOG_WARNING("{} placeholder occurrence(s) could not be resolved",
                           report.unresolved.size());
    }
    DOCSAN_LOG_DEBUG("Decode restored {} placeholder occurrences", report.resolvedCount);
    return report;
}

}  // namespace docsan::pipeline
