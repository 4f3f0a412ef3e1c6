// =============================================================================
// docsan - Encode Session Implementation
// =============================================================================

#include "docsan/pipeline/encode_session.h"

#include <algorithm>
#include <format>
#include <iterator>

#include "docsan/algo/entity_normalizer.h"
#include "docsan/algo/legend_generator.h"
#include "docsan/algo/substitution_engine.h"
#include "docsan/common/error.h"
#include "docsan/common/logger.h"
#include "docsan/format/mapping_writer.h"

namespace docsan::pipeline {

std::string_view encodeStateToString(EncodeState state) noexcept {
    switch (state) {
        case EncodeState::kRaw:
            return "raw";
        case EncodeState::kSpansResolved:
            return "spans-resolved";
        case EncodeState::kEntitiesNormalized:
            return "entities-normalized";
        case EncodeState::kPlaceholdersAllocated:
            return "placeholders-allocated";
        case EncodeState::kSanitized:
            return "sanitized";
        case EncodeState::kMappingPersisted:
            return "mapping-persisted";
        case EncodeState::kFailed:
            return "failed";
    }
    return "unknown";
}

EncodeSession::EncodeSession(EncodeOptions options) : options_(std::move(options)) {}

void EncodeSession::requireState(EncodeState expected, std::string_view operation) const {
    if (state_ != expected) {
        throw DocsanException(ErrorCode::kInvalidState,
                              std::format("cannot {} in state '{}' (expected '{}')", operation,
                                          encodeStateToString(state_),
                                          encodeStateToString(expected)));
    }
}

void EncodeSession::advance(EncodeState next) {
    DOCSAN_LOG_TRACE("Encode session: {} -> {}", encodeStateToString(state_),
                     encodeStateToString(next));
    state_ = next;
}

EncodeResult EncodeSession::run(std::string_view source, std::vector<Span> candidates) {
    requireState(EncodeState::kRaw, "run an encode session");
    try {
        return runStages(source, std::move(candidates));
    } catch (const DocsanException&) {
        state_ = EncodeState::kFailed;
        throw;
    }
}

EncodeResult EncodeSession::run(std::string_view source, const detect::Detector& detector) {
    requireState(EncodeState::kRaw, "run an encode session");
    std::vector<Span> candidates;
    try {
        candidates = detector.scan(source);
    } catch (const DocsanException&) {
        state_ = EncodeState::kFailed;
        throw;
    }
    DOCSAN_LOG_DEBUG("Detector '{}' reported {} candidate spans", detector.name(),
                     candidates.size());
    return run(source, std::move(candidates));
}

EncodeResult EncodeSession::runStages(std::string_view source, std::vector<Span> candidates) {
    unwrapOrThrow(options_.delimiters.validate());
    algo::checkDelimiterCollision(source, options_.delimiters);

    EncodeResult result;
    auto& stats = result.stats;
    stats.sourceBytes = source.size();

    // Stage 1: resolve overlapping candidates
    algo::SpanResolver resolver(options_.priorities);
    std::vector<Span> resolved = resolver.resolve(source, std::move(candidates), &stats.resolve);
    advance(EncodeState::kSpansResolved);

    // Stage 2: group into entities, then sweep for occurrences the detectors missed
    algo::EntityNormalizer normalizer;
    algo::SubstitutionEngine engine(options_.delimiters);
    algo::NormalizationResult normalized = normalizer.normalize(resolved);

    if (options_.sweepVariants && !normalized.entities.empty()) {
        std::vector<Span> swept =
            engine.sweepVariants(source, resolved, normalized.entities, options_.minSweepLength);
        if (!swept.empty()) {
            stats.swept = swept.size();
            std::vector<Span> merged;
            merged.reserve(resolved.size() + swept.size());
            std::merge(std::make_move_iterator(resolved.begin()),
                       std::make_move_iterator(resolved.end()),
                       std::make_move_iterator(swept.begin()),
                       std::make_move_iterator(swept.end()), std::back_inserter(merged),
                       [](const Span& a, const Span& b) { return a.start < b.start; });
            // Re-normalize so first occurrences follow text order
            normalized = normalizer.normalize(merged);
        }
    }
    stats.entities = normalized.entities.size();
    stats.occurrences = normalized.occurrences.size();
    stats.discarded = normalized.discarded;
    advance(EncodeState::kEntitiesNormalized);

    // Stage 3: allocate TYPE_n tokens in order of first occurrence
    algo::PlaceholderAllocator allocator(options_.delimiters);
    std::vector<algo::AllocatedPlaceholder> placeholders = allocator.allocate(normalized.entities);
    advance(EncodeState::kPlaceholdersAllocated);

    // Stage 4: rewrite
    result.sanitized = engine.rewrite(source, normalized.occurrences, placeholders);
    if (options_.checkLeaks) {
        engine.checkLeaks(result.sanitized, normalized.entities, options_.minSweepLength);
    }

    format::MappingHeader header;
    header.delimiters = options_.delimiters;
    header.sourceFingerprint = format::fingerprint(source);
    header.sourceLength = source.size();

    algo::TypeSet types;
    for (const auto& entity : normalized.entities) {
        types.insert(entity.type);
    }
    if (algo::containsBareTokens(source, types)) {
        stats.sourceHasBareTokens = true;
        header.flags |= format::flags::kSourceHasBareTokens;
        DOCSAN_LOG_WARNING("Source already contains undelimited TYPE_n text; "
                           "bare-token decoding will be refused for this mapping");
    }

    const algo::TypeCounts counts = algo::LegendGenerator::countByType(normalized.entities);
    if (options_.appendLegend && !counts.empty()) {
        result.sanitized = algo::LegendGenerator::append(result.sanitized, counts);
        header.flags |= format::flags::kHasLegend;
    }
    header.sanitizedFingerprint = format::fingerprint(result.sanitized);
    stats.sanitizedBytes = result.sanitized.size();

    std::vector<format::MappingEntry> entries;
    entries.reserve(placeholders.size());
    for (const auto& placeholder : placeholders) {
        const auto& entity = normalized.entities[placeholder.entityIndex];
        format::MappingEntry entry;
        entry.index = placeholder.token.index;
        entry.type = entity.type;
        entry.canonical = entity.canonical;
        entry.occurrences = entity.occurrences;
        entry.variants = entity.variants;
        entries.push_back(std::move(entry));
    }
    result.mapping = format::MappingArtifact(header, std::move(entries));
    advance(EncodeState::kSanitized);

    DOCSAN_LOG_DEBUG("Encoded {} occurrences of {} entities ({} swept): {}", stats.occurrences,
                     stats.entities, stats.swept, algo::LegendGenerator::summary(counts));
    return result;
}

void EncodeSession::persist(const EncodeResult& result, const std::filesystem::path& mappingPath,
                            bool overwrite) {
    requireState(EncodeState::kSanitized, "persist a mapping");
    try {
        format::MappingWriter(mappingPath, overwrite).write(result.mapping);
    } catch (const DocsanException&) {
        state_ = EncodeState::kFailed;
        throw;
    }
    advance(EncodeState::kMappingPersisted);
}

}  // namespace docsan::pipeline
