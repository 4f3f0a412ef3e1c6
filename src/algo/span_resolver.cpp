// =============================================================================
// docsan - Span Resolver Implementation
// =============================================================================

#include "docsan/algo/span_resolver.h"

#include <algorithm>

#include "docsan/common/logger.h"

namespace docsan::algo {

namespace {

/// @brief Validate a candidate and refresh its surface text from the source.
/// @return false if the candidate must be dropped.
bool sanitizeCandidate(std::string_view source, Span& span) {
    if (span.end <= span.start || span.end > source.size()) {
        DOCSAN_LOG_DEBUG("Dropping span with invalid range [{}, {}) (text length {})", span.start,
                         span.end, source.size());
        return false;
    }

    std::string tag = canonicalTypeTag(span.type);
    if (!isValidTypeTag(tag)) {
        DOCSAN_LOG_DEBUG("Dropping span [{}, {}) with invalid type tag", span.start, span.end);
        return false;
    }
    span.type = std::move(tag);

    std::string_view actual = source.substr(span.start, span.length());
    if (isBlank(actual)) {
        DOCSAN_LOG_DEBUG("Dropping whitespace-only {} span at {}", span.type, span.start);
        return false;
    }
    if (!span.surface.empty() && span.surface != actual) {
        DOCSAN_LOG_DEBUG("Detector surface for {} span at {} disagrees with source; using source",
                         span.type, span.start);
    }
    span.surface.assign(actual);
    span.confidence = std::clamp(span.confidence, 0.0, 1.0);
    return true;
}

}  // namespace

// =============================================================================
// SpanResolver
// =============================================================================

bool SpanResolver::wins(const Span& candidate, const Span& accepted) const {
    const int candidatePriority = priorities_.priorityOf(candidate.type);
    const int acceptedPriority = priorities_.priorityOf(accepted.type);
    if (candidatePriority != acceptedPriority) {
        return candidatePriority > acceptedPriority;
    }
    if (candidate.length() != accepted.length()) {
        return candidate.length() > accepted.length();
    }
    return candidate.confidence > accepted.confidence;
}

std::vector<Span> SpanResolver::resolve(std::string_view source, std::vector<Span> candidates,
                                        ResolveStats* stats) const {
    ResolveStats local;
    local.candidates = candidates.size();

    std::size_t kept = 0;
    for (auto& span : candidates) {
        if (sanitizeCandidate(source, span)) {
            if (&candidates[kept] != &span) {
                candidates[kept] = std::move(span);
            }
            ++kept;
        }
    }
    local.malformed = candidates.size() - kept;
    candidates.resize(kept);

    // (start, -length) first; the remaining keys only make equal-range
    // candidates independent of input order.
    std::sort(candidates.begin(), candidates.end(), [this](const Span& a, const Span& b) {
        if (a.start != b.start) {
            return a.start < b.start;
        }
        if (a.length() != b.length()) {
            return a.length() > b.length();
        }
        const int pa = priorities_.priorityOf(a.type);
        const int pb = priorities_.priorityOf(b.type);
        if (pa != pb) {
            return pa > pb;
        }
        if (a.confidence != b.confidence) {
            return a.confidence > b.confidence;
        }
        return a.type < b.type;
    });

    std::vector<Span> accepted;
    accepted.reserve(candidates.size());

    for (auto& candidate : candidates) {
        if (accepted.empty() || !candidate.overlaps(accepted.back())) {
            accepted.push_back(std::move(candidate));
            continue;
        }

        ++local.rejected;
        if (wins(candidate, accepted.back())) {
            DOCSAN_LOG_TRACE("{} span at {} replaces {} span at {}", candidate.type,
                             candidate.start, accepted.back().type, accepted.back().start);
            accepted.back() = std::move(candidate);
        }
    }

    local.accepted = accepted.size();
    if (stats != nullptr) {
        *stats = local;
    }
    return accepted;
}

std::vector<Span> SpanResolver::resolve(std::string_view source,
                                        std::span<const std::vector<Span>> lists,
                                        ResolveStats* stats) const {
    std::vector<Span> merged;
    for (const auto& list : lists) {
        merged.insert(merged.end(), list.begin(), list.end());
    }
    return resolve(source, std::move(merged), stats);
}

bool isOrderedNonOverlapping(std::span<const Span> spans) noexcept {
    for (std::size_t i = 1; i < spans.size(); ++i) {
        if (spans[i].start < spans[i - 1].end) {
            return false;
        }
    }
    return true;
}

}  // namespace docsan::algo
