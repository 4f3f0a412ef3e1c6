// =============================================================================
// docsan - Entity Normalizer
// =============================================================================
// Groups resolved spans into canonical entities.
//
// Two spans belong to the same entity iff they carry the same type tag and
// their values normalize equal under the type's NormalizationRule. The first
// occurrence (in text order) fixes the canonical value and the entity order.
// =============================================================================

#ifndef DOCSAN_ALGO_ENTITY_NORMALIZER_H
#define DOCSAN_ALGO_ENTITY_NORMALIZER_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "docsan/common/types.h"

namespace docsan::algo {

// =============================================================================
// Entity
// =============================================================================

/// @brief A distinct sensitive value observed in one document.
struct Entity {
    /// @brief Stable identifier (position in first-occurrence order).
    std::uint32_t id = 0;

    std::string type;

    /// @brief Surface text of the first occurrence.
    std::string canonical;

    /// @brief Normalized value used as grouping key.
    std::string normalized;

    /// @brief Distinct surface variants in order of first appearance.
    /// @note Always contains the canonical value first.
    std::vector<std::string> variants;

    ByteOffset firstOffset = 0;

    std::uint32_t occurrences = 0;
};

/// @brief A resolved span tied to the entity it belongs to.
struct EntityOccurrence {
    Span span;
    std::size_t entityIndex = 0;
};

/// @brief Output of EntityNormalizer::normalize().
struct NormalizationResult {
    std::vector<Entity> entities;

    /// @brief Occurrences in text order.
    std::vector<EntityOccurrence> occurrences;

    /// @brief Spans discarded before grouping (empty or whitespace-only).
    std::size_t discarded = 0;
};

// =============================================================================
// Normalization
// =============================================================================

/// @brief Normalize a value under the equivalence rule of its type.
[[nodiscard]] std::string normalizeValue(std::string_view type, std::string_view value);

/// @brief Groups spans into entities.
class EntityNormalizer {
public:
    /// @brief Group spans into entities.
    /// @param spans Non-overlapping spans ordered by start offset.
    [[nodiscard]] NormalizationResult normalize(std::span<const Span> spans) const;
};

}  // namespace docsan::algo

#endif  // DOCSAN_ALGO_ENTITY_NORMALIZER_H
