// =============================================================================
// docsan - Common Type Definitions
// =============================================================================
// Core type definitions shared by every docsan module.
//
// This module defines:
// - Span: a detector-reported, type-tagged byte range of the source text
// - Type aliases for offsets, placeholder indexes and checksums
// - Entity type tag validation
// - ASCII text helpers used by normalization and matching
//
// All offsets are byte offsets into UTF-8 text. Case folding is ASCII-only:
// bytes >= 0x80 compare exactly.
// =============================================================================

#ifndef DOCSAN_COMMON_TYPES_H
#define DOCSAN_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace docsan {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Byte offset into a UTF-8 document.
using ByteOffset = std::size_t;

/// @brief Per-type placeholder index (1-based).
using PlaceholderIndex = std::uint32_t;

/// @brief Type alias for checksum / fingerprint values (xxHash64).
using Checksum = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Invalid offset sentinel value.
inline constexpr ByteOffset kInvalidOffset = std::numeric_limits<ByteOffset>::max();

/// @brief Default minimum length (bytes) of a value that is swept for
///        undetected occurrences and checked for leakage.
inline constexpr std::size_t kDefaultMinSweepLength = 4;

/// @brief Maximum entity type tag length.
inline constexpr std::size_t kMaxTypeTagLength = 64;

// =============================================================================
// Span
// =============================================================================

/// @brief A detected, type-tagged range of the source text.
/// @note Produced by a Detector; never persisted directly.
struct Span {
    /// @brief First byte of the range.
    ByteOffset start = 0;

    /// @brief One past the last byte of the range.
    ByteOffset end = 0;

    /// @brief Entity type tag (e.g. "PERSON", "PHONE").
    std::string type;

    /// @brief Detector confidence in [0, 1].
    double confidence = 1.0;

    /// @brief Literal surface text of the range.
    std::string surface;

    /// @brief Length of the range in bytes.
    [[nodiscard]] std::size_t length() const noexcept { return end > start ? end - start : 0; }

    /// @brief Check whether this span overlaps another one.
    [[nodiscard]] bool overlaps(const Span& other) const noexcept {
        return start < other.end && other.start < end;
    }

    bool operator==(const Span& other) const = default;
};

// =============================================================================
// Entity Type Tags
// =============================================================================

/// @brief Check that a tag matches [A-Z][A-Z0-9_]* and does not end in '_'.
[[nodiscard]] bool isValidTypeTag(std::string_view tag) noexcept;

/// @brief Upper-case a tag and trim surrounding whitespace.
/// @note The result may still be invalid; check with isValidTypeTag().
[[nodiscard]] std::string canonicalTypeTag(std::string_view tag);

// =============================================================================
// ASCII Text Helpers
// =============================================================================

[[nodiscard]] constexpr char toUpperAscii(char c) noexcept {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

[[nodiscard]] constexpr char toLowerAscii(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

[[nodiscard]] constexpr bool isAsciiSpace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

[[nodiscard]] constexpr bool isAsciiDigit(char c) noexcept {
    return c >= '0' && c <= '9';
}

[[nodiscard]] constexpr bool isAsciiAlpha(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

/// @brief Word character for boundary checks: ASCII alnum, '_' or any byte of
///        a multi-byte UTF-8 sequence.
[[nodiscard]] constexpr bool isWordByte(char c) noexcept {
    return isAsciiAlpha(c) || isAsciiDigit(c) || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

/// @brief Upper-case all ASCII letters.
[[nodiscard]] std::string toUpperAscii(std::string_view text);

/// @brief Lower-case all ASCII letters.
[[nodiscard]] std::string toLowerAscii(std::string_view text);

/// @brief Check whether text is empty or only ASCII whitespace.
[[nodiscard]] bool isBlank(std::string_view text) noexcept;

/// @brief Trim ASCII whitespace and collapse inner runs to a single space.
[[nodiscard]] std::string collapseWhitespace(std::string_view text);

/// @brief ASCII case-insensitive equality.
[[nodiscard]] bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept;

/// @brief ASCII case-insensitive search.
/// @return Offset of the first match at or after @p from, or npos.
[[nodiscard]] std::size_t findIgnoreCase(std::string_view haystack,
                                         std::string_view needle,
                                         std::size_t from = 0) noexcept;

/// @brief Quote a short excerpt of text for log and error messages.
/// @note Newlines are escaped and the excerpt is cut at a UTF-8 boundary.
[[nodiscard]] std::string excerpt(std::string_view text, std::size_t maxBytes);

}  // namespace docsan

#endif  // DOCSAN_COMMON_TYPES_H
