// =============================================================================
// docsan - Entity Type Traits
// =============================================================================
// Static knowledge about the entity type tags docsan understands:
// - Overlap priority used by the span resolver
// - Normalization rule used to group surface variants into one entity
// - Singular/plural nouns used by the legend
//
// Unknown (detector-defined) tags are accepted everywhere. They get the
// default normalization rule, the lowest priority and a generated noun.
// =============================================================================

#ifndef DOCSAN_ALGO_ENTITY_TYPE_H
#define DOCSAN_ALGO_ENTITY_TYPE_H

#include <cstdint>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>

#include "docsan/common/error.h"

namespace docsan::algo {

// =============================================================================
// Normalization Rules
// =============================================================================

/// @brief How surface variants of a type are compared.
enum class NormalizationRule : std::uint8_t {
    /// @brief ASCII case folding plus whitespace collapse.
    kDefault = 0,

    /// @brief Case-insensitive exact match (no fuzzy name matching).
    kNameLike = 1,

    /// @brief Default rule plus removal of type-specific formatting characters.
    kIdentifier = 2
};

// =============================================================================
// Type Traits
// =============================================================================

/// @brief Built-in properties of a known entity type.
struct EntityTypeTraits {
    std::string_view tag;
    int priority;
    NormalizationRule rule;

    /// @brief Formatting characters removed by kIdentifier normalization.
    std::string_view stripChars;

    std::string_view singular;
    std::string_view plural;
};

/// @brief Priority assigned to tags missing from the table.
inline constexpr int kUnknownTypePriority = 10;

/// @brief Look up built-in traits of a type tag.
/// @return Traits, or nullptr for unknown tags.
[[nodiscard]] const EntityTypeTraits* findTypeTraits(std::string_view tag) noexcept;

/// @brief All built-in types, ordered by descending priority.
[[nodiscard]] std::span<const EntityTypeTraits> knownTypes() noexcept;

/// @brief Legend noun for a type and a count.
/// @note Unknown types render as "<lower-cased type> value(s)".
[[nodiscard]] std::string typeNoun(std::string_view tag, std::size_t count);

// =============================================================================
// PriorityTable
// =============================================================================

/// @brief Overlap priority per type tag: built-in defaults plus overrides.
class PriorityTable {
public:
    PriorityTable() = default;

    /// @brief Priority of a tag (override, else built-in, else unknown).
    [[nodiscard]] int priorityOf(std::string_view tag) const;

    /// @brief Override the priority of a tag.
    void set(std::string tag, int priority);

    /// @brief Parse and apply an override of the form "TYPE=PRIORITY".
    [[nodiscard]] VoidResult applyOverride(std::string_view spec);

    /// @brief Number of overrides.
    [[nodiscard]] std::size_t overrideCount() const noexcept { return overrides_.size(); }

private:
    std::map<std::string, int, std::less<>> overrides_;
};

}  // namespace docsan::algo

#endif  // DOCSAN_ALGO_ENTITY_TYPE_H
