// =============================================================================
// docsan - Substitution Engine
// =============================================================================
// Forward pass (encode) and tolerant reverse pass (decode).
//
// Forward:
//   1. sweepVariants(): spans for undetected occurrences of known variants
//   2. rewrite(): one linear left-to-right pass emitting placeholders
//   3. checkLeaks(): verify no known value survives outside placeholders
//
// Reverse:
//   restore() scans for placeholders, tolerating the decoration a language
//   model typically adds (emphasis markers, changed type case, whitespace
//   inside the delimiters). Each match is resolved independently; unknown
//   tokens are left untouched and reported.
//
// Text outside replaced ranges is always copied byte-for-byte.
// =============================================================================

#ifndef DOCSAN_ALGO_SUBSTITUTION_ENGINE_H
#define DOCSAN_ALGO_SUBSTITUTION_ENGINE_H

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "docsan/algo/entity_normalizer.h"
#include "docsan/algo/placeholder.h"
#include "docsan/common/types.h"

namespace docsan::algo {

// =============================================================================
// Reverse Pass Tolerance
// =============================================================================

/// @brief What the reverse pass accepts as a placeholder occurrence.
struct TolerancePolicy {
    /// @brief Accept "⟦person_1⟧" for PERSON_1.
    bool caseInsensitiveType = true;

    /// @brief Whitespace bytes allowed on each side of the core inside the
    ///        delimiters (0 disables).
    std::size_t maxInnerWhitespace = 2;

    /// @brief Accept '*', '`' and '~' around the core inside the delimiters.
    bool allowInnerEmphasis = true;

    /// @brief Emphasis characters allowed on each side.
    std::size_t maxInnerEmphasis = 3;

    /// @brief Accept "PERSON_001" for PERSON_1.
    bool acceptZeroPaddedIndex = false;

    /// @brief Also match undelimited "TYPE_n" words of mapped types.
    bool matchBareTokens = false;

    /// @brief Exact matching only: no decoration, case or padding tolerance.
    [[nodiscard]] static TolerancePolicy strict() noexcept;

    [[nodiscard]] CoreParseOptions coreOptions() const noexcept {
        return {.caseInsensitiveType = caseInsensitiveType,
                .acceptZeroPaddedIndex = acceptZeroPaddedIndex};
    }
};

// =============================================================================
// Results
// =============================================================================

/// @brief A placeholder-like occurrence the mapping could not resolve.
struct UnresolvedToken {
    /// @brief Normalized core token (e.g. "PERSON_9").
    std::string token;

    /// @brief Matched text, left unchanged in the output.
    std::string raw;

    /// @brief Byte offset of the match in the decoded input.
    ByteOffset offset = 0;
};

/// @brief Output of the reverse pass.
struct ReverseResult {
    std::string restored;

    /// @brief Unresolved occurrences in text order.
    std::vector<UnresolvedToken> unresolved;

    /// @brief Number of occurrences replaced by a canonical value.
    std::size_t resolved = 0;
};

/// @brief A value still present in sanitized text.
struct LeakReport {
    std::size_t entityIndex = 0;
    ByteOffset offset = 0;
};

// =============================================================================
// SubstitutionEngine
// =============================================================================

class SubstitutionEngine {
public:
    explicit SubstitutionEngine(Delimiters delimiters = {}) : delimiters_(std::move(delimiters)) {}

    // -------------------------------------------------------------------------
    // Forward pass
    // -------------------------------------------------------------------------

    /// @brief Find undetected occurrences of known surface variants.
    ///
    /// Variants of at least @p minLength bytes are searched ASCII
    /// case-insensitively as plain substrings (also inside longer words) in
    /// text not covered by @p resolved. Longest variants are placed first, then leftmost;
    /// placed spans never overlap.
    ///
    /// @param source Source text.
    /// @param resolved Resolved spans ordered by start offset.
    /// @param entities Entities built from @p resolved.
    /// @param minLength Minimum variant length in bytes.
    /// @return Additional spans ordered by start offset.
    [[nodiscard]] std::vector<Span> sweepVariants(std::string_view source,
                                                  std::span<const Span> resolved,
                                                  std::span<const Entity> entities,
                                                  std::size_t minLength) const;

    /// @brief Replace every occurrence with its entity's placeholder.
    /// @param occurrences Non-overlapping occurrences ordered by start offset.
    /// @param placeholders Placeholder per entity index.
    /// @throws DocsanException (kInvalidState) if occurrences are unordered.
    [[nodiscard]] std::string rewrite(std::string_view source,
                                      std::span<const EntityOccurrence> occurrences,
                                      std::span<const AllocatedPlaceholder> placeholders) const;

    /// @brief Copy of sanitized text with every placeholder overwritten by
    ///        NUL bytes (offsets are preserved).
    [[nodiscard]] std::string maskPlaceholders(std::string_view sanitized) const;

    /// @brief Find the first value of at least @p minLength bytes that is
    ///        still present outside placeholders, as a case-insensitive
    ///        substring anywhere in the text.
    [[nodiscard]] std::optional<LeakReport> findLeak(std::string_view sanitized,
                                                     std::span<const Entity> entities,
                                                     std::size_t minLength) const;

    /// @brief Throw LeakDetectedError if findLeak() reports a value.
    /// @note The message names the entity type and offset, never the value.
    void checkLeaks(std::string_view sanitized, std::span<const Entity> entities,
                    std::size_t minLength) const;

    // -------------------------------------------------------------------------
    // Reverse pass
    // -------------------------------------------------------------------------

    /// @brief Replace placeholder occurrences with canonical values.
    /// @note Delimited text whose core is not TYPE_n is copied and not reported.
    [[nodiscard]] ReverseResult restore(std::string_view text, const PlaceholderTable& table,
                                        const TolerancePolicy& policy = {}) const;

    [[nodiscard]] const Delimiters& delimiters() const noexcept { return delimiters_; }

private:
    Delimiters delimiters_;
};

}  // namespace docsan::algo

#endif  // DOCSAN_ALGO_SUBSTITUTION_ENGINE_H
