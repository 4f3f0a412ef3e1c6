// =============================================================================
// docsan - Legend Generator
// =============================================================================
// Renders a value-free summary of what was replaced ("2 person names,
// 1 street address") that can be appended to sanitized text so the reader
// (human or model) understands the TYPE_n tokens.
//
// The legend is built from entity types only; it never contains values or
// placeholder delimiters.
// =============================================================================

#ifndef DOCSAN_ALGO_LEGEND_GENERATOR_H
#define DOCSAN_ALGO_LEGEND_GENERATOR_H

#include <cstddef>
#include <map>
#include <span>
#include <string>
#include <string_view>

#include "docsan/algo/entity_normalizer.h"

namespace docsan::algo {

/// @brief First line of a legend block.
inline constexpr std::string_view kLegendBeginMarker = "-----BEGIN DOCSAN LEGEND-----";

/// @brief Last line of a legend block.
inline constexpr std::string_view kLegendEndMarker = "-----END DOCSAN LEGEND-----";

/// @brief Entity count per type tag, ordered by tag.
using TypeCounts = std::map<std::string, std::size_t, std::less<>>;

class LegendGenerator {
public:
    /// @brief Count distinct entities per type.
    [[nodiscard]] static TypeCounts countByType(std::span<const Entity> entities);

    /// @brief One-line summary, e.g. "2 person names, 1 phone number".
    [[nodiscard]] static std::string summary(const TypeCounts& counts);

    /// @brief Full legend block (ends with a newline). Empty if no counts.
    [[nodiscard]] static std::string render(const TypeCounts& counts);

    /// @brief Append a legend block to sanitized text.
    [[nodiscard]] static std::string append(std::string_view sanitized, const TypeCounts& counts);

    /// @brief Remove a legend block (and the separator append() adds).
    /// @return Text without the legend; unchanged if none is found.
    [[nodiscard]] static std::string strip(std::string_view text);
};

}  // namespace docsan::algo

#endif  // DOCSAN_ALGO_LEGEND_GENERATOR_H
