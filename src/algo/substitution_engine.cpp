// =============================================================================
// docsan - Substitution Engine Implementation
// =============================================================================

#include "docsan/algo/substitution_engine.h"

#include <algorithm>
#include <format>
#include <map>

#include "docsan/common/error.h"
#include "docsan/common/logger.h"

namespace docsan::algo {

namespace {

[[nodiscard]] constexpr bool isEmphasisByte(char c) noexcept {
    return c == '*' || c == '`' || c == '~';
}

/// @brief Non-overlapping [start, end) intervals keyed by start.
using IntervalMap = std::map<ByteOffset, ByteOffset>;

[[nodiscard]] bool isFree(const IntervalMap& covered, ByteOffset start, ByteOffset end) {
    auto it = covered.lower_bound(end);
    if (it == covered.begin()) {
        return true;
    }
    --it;
    return it->second <= start;
}

/// @brief A placeholder-shaped match inside the delimiters.
struct DelimitedMatch {
    std::size_t end = 0;
    std::string_view core;
};

/// @brief Consume tolerated decoration (whitespace, emphasis) on one side.
/// @return false if the decoration exceeds the policy.
bool skipDecoration(std::string_view text, std::size_t& pos, const TolerancePolicy& policy) {
    std::size_t spaces = 0;
    std::size_t emphasis = 0;
    while (pos < text.size()) {
        const char c = text[pos];
        if (isAsciiSpace(c)) {
            if (++spaces > policy.maxInnerWhitespace) {
                return false;
            }
        } else if (isEmphasisByte(c)) {
            if (!policy.allowInnerEmphasis || ++emphasis > policy.maxInnerEmphasis) {
                return false;
            }
        } else {
            break;
        }
        ++pos;
    }
    return true;
}

/// @brief Match "<open>[decoration]CORE[decoration]<close>" at @p pos.
/// @pre text starts with the opening delimiter at @p pos.
std::optional<DelimitedMatch> matchDelimited(std::string_view text, std::size_t pos,
                                             const Delimiters& delimiters,
                                             const TolerancePolicy& policy) {
    std::size_t cursor = pos + delimiters.open.size();
    if (!skipDecoration(text, cursor, policy)) {
        return std::nullopt;
    }

    const std::size_t coreStart = cursor;
    while (cursor < text.size() && isCoreByte(text[cursor])) {
        ++cursor;
    }
    if (cursor == coreStart) {
        return std::nullopt;
    }
    std::string_view core = text.substr(coreStart, cursor - coreStart);

    if (!skipDecoration(text, cursor, policy)) {
        return std::nullopt;
    }
    if (text.substr(cursor).starts_with(delimiters.close)) {
        return DelimitedMatch{cursor + delimiters.close.size(), core};
    }
    return std::nullopt;
}

}  // namespace

// =============================================================================
// TolerancePolicy
// =============================================================================

TolerancePolicy TolerancePolicy::strict() noexcept {
    TolerancePolicy policy;
    policy.caseInsensitiveType = false;
    policy.maxInnerWhitespace = 0;
    policy.allowInnerEmphasis = false;
    policy.maxInnerEmphasis = 0;
    policy.acceptZeroPaddedIndex = false;
    policy.matchBareTokens = false;
    return policy;
}

// =============================================================================
// Forward Pass
// =============================================================================

std::vector<Span> SubstitutionEngine::sweepVariants(std::string_view source,
                                                    std::span<const Span> resolved,
                                                    std::span<const Entity> entities,
                                                    std::size_t minLength) const {
    struct Candidate {
        std::string_view value;
        std::size_t entityIndex;
    };

    std::vector<Candidate> candidates;
    for (std::size_t i = 0; i < entities.size(); ++i) {
        for (const auto& variant : entities[i].variants) {
            if (variant.size() >= std::max<std::size_t>(minLength, 1)) {
                candidates.push_back({variant, i});
            }
        }
    }
    // Longest first; ties by first occurrence of the entity
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) {
                         return a.value.size() > b.value.size();
                     });

    IntervalMap covered;
    for (const auto& span : resolved) {
        covered.emplace(span.start, span.end);
    }

    std::vector<Span> swept;
    for (const auto& candidate : candidates) {
        std::size_t pos = findIgnoreCase(source, candidate.value, 0);
        while (pos != std::string_view::npos) {
            const std::size_t end = pos + candidate.value.size();
            if (isFree(covered, pos, end)) {
                covered.emplace(pos, end);
                Span span;
                span.start = pos;
                span.end = end;
                span.type = entities[candidate.entityIndex].type;
                span.confidence = 1.0;
                span.surface.assign(source.substr(pos, end - pos));
                swept.push_back(std::move(span));
                pos = findIgnoreCase(source, candidate.value, end);
            } else {
                pos = findIgnoreCase(source, candidate.value, pos + 1);
            }
        }
    }

    std::sort(swept.begin(), swept.end(),
              [](const Span& a, const Span& b) { return a.start < b.start; });

    if (!swept.empty()) {
        DOCSAN_LOG_DEBUG("Variant sweep found {} undetected occurrences", swept.size());
    }
    return swept;
}

std::string SubstitutionEngine::rewrite(std::string_view source,
                                        std::span<const EntityOccurrence> occurrences,
                                        std::span<const AllocatedPlaceholder> placeholders) const {
    std::string out;
    out.reserve(source.size());

    ByteOffset cursor = 0;
    for (const auto& occurrence : occurrences) {
        const auto& span = occurrence.span;
        if (span.start < cursor || span.end > source.size() || span.end <= span.start) {
            throw DocsanException(ErrorCode::kInvalidState,
                                  std::format("occurrence [{}, {}) is out of order or out of range",
                                              span.start, span.end));
        }
        if (occurrence.entityIndex >= placeholders.size() ||
            placeholders[occurrence.entityIndex].entityIndex != occurrence.entityIndex) {
            throw DocsanException(ErrorCode::kInvalidState,
                                  std::format("no placeholder allocated for entity {}",
                                              occurrence.entityIndex));
        }

        out.append(source.substr(cursor, span.start - cursor));
        out.append(placeholders[occurrence.entityIndex].text);
        cursor = span.end;
    }
    out.append(source.substr(cursor));
    return out;
}

std::string SubstitutionEngine::maskPlaceholders(std::string_view sanitized) const {
    std::string masked(sanitized);
    std::size_t pos = masked.find(delimiters_.open);
    while (pos != std::string::npos) {
        const std::size_t close = masked.find(delimiters_.close, pos + delimiters_.open.size());
        if (close == std::string::npos) {
            break;
        }
        const std::size_t end = close + delimiters_.close.size();
        std::fill(masked.begin() + static_cast<std::ptrdiff_t>(pos),
                  masked.begin() + static_cast<std::ptrdiff_t>(end), '\0');
        pos = masked.find(delimiters_.open, end);
    }
    return masked;
}

std::optional<LeakReport> SubstitutionEngine::findLeak(std::string_view sanitized,
                                                       std::span<const Entity> entities,
                                                       std::size_t minLength) const {
    const std::string masked = maskPlaceholders(sanitized);
    for (std::size_t i = 0; i < entities.size(); ++i) {
        for (const auto& variant : entities[i].variants) {
            if (variant.size() < std::max<std::size_t>(minLength, 1)) {
                continue;
            }
            if (auto pos = findIgnoreCase(masked, variant, 0); pos != std::string_view::npos) {
                return LeakReport{i, pos};
            }
        }
    }
    return std::nullopt;
}

void SubstitutionEngine::checkLeaks(std::string_view sanitized, std::span<const Entity> entities,
                                    std::size_t minLength) const {
    if (auto leak = findLeak(sanitized, entities, minLength)) {
        const auto& entity = entities[leak->entityIndex];
        throw LeakDetectedError(
            std::format("{} value still present in sanitized text at offset {}", entity.type,
                        leak->offset),
            ErrorContext{}.withOffset(leak->offset));
    }
}

// =============================================================================
// Reverse Pass
// =============================================================================

ReverseResult SubstitutionEngine::restore(std::string_view text, const PlaceholderTable& table,
                                          const TolerancePolicy& policy) const {
    ReverseResult result;
    result.restored.reserve(text.size());

    const CoreParseOptions parseOptions = policy.coreOptions();
    const std::string_view open = delimiters_.open;

    auto resolve = [&](std::string_view core, std::string_view raw, ByteOffset offset) {
        auto token = parseCore(core, parseOptions);
        if (token) {
            if (const std::string* canonical = table.find(token->core())) {
                result.restored.append(*canonical);
                ++result.resolved;
                return;
            }
        }
        result.restored.append(raw);
        if (!token) {
            return;  // not TYPE_n: plain text
        }
        result.unresolved.push_back({token->core(), std::string(raw), offset});
    };

    std::size_t pos = 0;
    while (pos < text.size()) {
        if (text.substr(pos).starts_with(open)) {
            if (auto match = matchDelimited(text, pos, delimiters_, policy)) {
                resolve(match->core, text.substr(pos, match->end - pos), pos);
                pos = match->end;
            } else {
                result.restored.append(open);
                pos += open.size();
            }
            continue;
        }

        if (policy.matchBareTokens && isCoreByte(text[pos]) &&
            (pos == 0 || !isCoreByte(text[pos - 1]))) {
            std::size_t end = pos;
            while (end < text.size() && isCoreByte(text[end])) {
                ++end;
            }
            std::string_view word = text.substr(pos, end - pos);
            auto token = parseCore(word, parseOptions);
            if (token && table.hasType(token->type)) {
                resolve(word, word, pos);
            } else {
                result.restored.append(word);
            }
            pos = end;
            continue;
        }

        result.restored.push_back(text[pos]);
        ++pos;
    }

    DOCSAN_LOG_DEBUG("Reverse pass resolved {} placeholders, {} unresolved", result.resolved,
                     result.unresolved.size());
    return result;
}

}  // namespace docsan::algo
