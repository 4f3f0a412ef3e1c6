// =============================================================================
// docsan - Placeholder Tokens and Allocation
// =============================================================================
// Placeholders have the form <open>TYPE_n<close>, e.g. "⟦PERSON_1⟧":
// - TYPE is the entity type tag
// - n >= 1 is a per-type counter in order of first occurrence (no padding)
// - <open>/<close> default to U+27E6 / U+27E7
//
// This module defines:
// - Delimiters and their validation
// - Core token formatting and parsing ("PERSON_1")
// - The delimiter collision scan run on raw source text
// - PlaceholderAllocator (per-type counters of one encode session)
// - PlaceholderTable (core token -> canonical value, used by decode)
// =============================================================================

#ifndef DOCSAN_ALGO_PLACEHOLDER_H
#define DOCSAN_ALGO_PLACEHOLDER_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "docsan/algo/entity_normalizer.h"
#include "docsan/common/error.h"
#include "docsan/common/types.h"

namespace docsan::algo {

// =============================================================================
// Delimiters
// =============================================================================

/// @brief UTF-8 encoding of U+27E6 MATHEMATICAL LEFT WHITE SQUARE BRACKET.
inline constexpr std::string_view kDefaultOpenDelimiter = "\xE2\x9F\xA6";

/// @brief UTF-8 encoding of U+27E7 MATHEMATICAL RIGHT WHITE SQUARE BRACKET.
inline constexpr std::string_view kDefaultCloseDelimiter = "\xE2\x9F\xA7";

/// @brief Maximum delimiter length in bytes.
inline constexpr std::size_t kMaxDelimiterLength = 16;

/// @brief Placeholder delimiter pair.
struct Delimiters {
    std::string open{kDefaultOpenDelimiter};
    std::string close{kDefaultCloseDelimiter};

    /// @brief Check that both delimiters are usable.
    /// @note Each must be non-empty and free of ASCII alnum, '_' and whitespace.
    [[nodiscard]] VoidResult validate() const;

    bool operator==(const Delimiters& other) const = default;
};

// =============================================================================
// Core Tokens
// =============================================================================

/// @brief Byte allowed inside a "TYPE_n" core: ASCII alnum or '_'.
[[nodiscard]] constexpr bool isCoreByte(char c) noexcept {
    return isAsciiAlpha(c) || isAsciiDigit(c) || c == '_';
}

/// @brief The "TYPE_n" part of a placeholder.
struct PlaceholderToken {
    std::string type;
    PlaceholderIndex index = 0;

    /// @brief Render as "TYPE_n".
    [[nodiscard]] std::string core() const;

    bool operator==(const PlaceholderToken& other) const = default;
};

/// @brief Render "TYPE_n".
[[nodiscard]] std::string formatCore(std::string_view type, PlaceholderIndex index);

/// @brief Render "<open>TYPE_n<close>".
[[nodiscard]] std::string formatPlaceholder(const Delimiters& delimiters, std::string_view type,
                                            PlaceholderIndex index);

/// @brief Options for parseCore().
struct CoreParseOptions {
    /// @brief Accept lower/mixed-case type names ("person_1").
    bool caseInsensitiveType = true;

    /// @brief Accept zero-padded indexes ("PERSON_001").
    bool acceptZeroPaddedIndex = false;
};

/// @brief Parse "TYPE_n" into a normalized token.
/// @return Token, or nullopt if @p core is not a well-formed placeholder core.
[[nodiscard]] std::optional<PlaceholderToken> parseCore(std::string_view core,
                                                        const CoreParseOptions& options = {});

// =============================================================================
// Collision Scan
// =============================================================================

/// @brief Find the first occurrence of either delimiter in @p source.
/// @return Byte offset, or nullopt if the source is free of delimiters.
[[nodiscard]] std::optional<ByteOffset> findDelimiterCollision(std::string_view source,
                                                               const Delimiters& delimiters) noexcept;

/// @brief Fail fast if @p source contains a delimiter.
/// @throws PlaceholderCollisionError with the offset and a short excerpt.
void checkDelimiterCollision(std::string_view source, const Delimiters& delimiters);

/// @brief Set of type tags with heterogeneous lookup.
using TypeSet = std::set<std::string, std::less<>>;

/// @brief Check whether @p source contains undelimited "TYPE_n" words for
///        any of @p types (compared case-insensitively).
[[nodiscard]] bool containsBareTokens(std::string_view source, const TypeSet& types);

// =============================================================================
// PlaceholderAllocator
// =============================================================================

/// @brief Placeholder assigned to one entity.
struct AllocatedPlaceholder {
    std::size_t entityIndex = 0;
    PlaceholderToken token;
    std::string text;
};

/// @brief Per-type counters of one encode session.
class PlaceholderAllocator {
public:
    explicit PlaceholderAllocator(Delimiters delimiters = {}) : delimiters_(std::move(delimiters)) {}

    /// @brief Increment the counter of @p type and return the new index.
    PlaceholderIndex next(std::string_view type);

    /// @brief Current counter of @p type (0 if never used).
    [[nodiscard]] PlaceholderIndex current(std::string_view type) const;

    /// @brief Assign placeholders to entities in first-occurrence order.
    /// @param entities Entities ordered by first occurrence.
    [[nodiscard]] std::vector<AllocatedPlaceholder> allocate(std::span<const Entity> entities);

    [[nodiscard]] const Delimiters& delimiters() const noexcept { return delimiters_; }

private:
    Delimiters delimiters_;
    std::map<std::string, PlaceholderIndex, std::less<>> counters_;
};

// =============================================================================
// PlaceholderTable
// =============================================================================

/// @brief Lookup of canonical values by normalized core token.
class PlaceholderTable {
public:
    /// @brief Register a core token.
    /// @return false if the core token is already present.
    bool add(std::string core, std::string type, std::string canonical);

    /// @brief Canonical value for a normalized core token, or nullptr.
    [[nodiscard]] const std::string* find(std::string_view core) const;

    /// @brief Check whether any placeholder of @p type is registered.
    [[nodiscard]] bool hasType(std::string_view type) const;

    [[nodiscard]] const TypeSet& types() const noexcept { return types_; }

    [[nodiscard]] std::size_t size() const noexcept { return canonical_.size(); }

    [[nodiscard]] bool empty() const noexcept { return canonical_.empty(); }

private:
    std::unordered_map<std::string, std::string> canonical_;
    TypeSet types_;
};

}  // namespace docsan::algo

#endif  // DOCSAN_ALGO_PLACEHOLDER_H
