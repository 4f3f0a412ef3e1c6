// =============================================================================
// docsan - Mapping Artifact Format Definitions
// =============================================================================
// Binary layout of the .dsm mapping artifact written at the end of encode.
//
// File Layout (all integers little-endian):
// +------------------+
// |   Magic Header   |  8 magic bytes + 1 version byte
// +------------------+
// |   Header         |  u32 headerSize, u32 flags,
// |                  |  u64 sourceFingerprint, u64 sanitizedFingerprint,
// |                  |  u64 sourceLength, u32 entryCount,
// |                  |  u16 + bytes open delimiter, u16 + bytes close delimiter
// +------------------+
// |   Entry 0..N-1   |  u32 index, u16 + bytes type, u32 + bytes canonical,
// |                  |  u32 occurrences, u32 variantCount,
// |                  |  (u32 + bytes variant) * variantCount
// +------------------+
// |   File Footer    |  u64 xxHash64 of all preceding bytes, "DSM_EOF\0"
// +------------------+
//
// No timestamps are stored: identical input yields identical bytes.
// =============================================================================

#ifndef DOCSAN_FORMAT_MAPPING_FORMAT_H
#define DOCSAN_FORMAT_MAPPING_FORMAT_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace docsan::format {

// =============================================================================
// Magic Header Constants
// =============================================================================

/// @brief 0x89 "DSM" CR LF ^Z LF, so 7-bit and newline-translating
///        transfers corrupt the first bytes visibly.
inline constexpr std::array<std::uint8_t, 8> kMagicBytes = {
    0x89, 'D', 'S', 'M', 0x0D, 0x0A, 0x1A, 0x0A
};

/// @brief Magic plus the version byte.
inline constexpr std::size_t kMagicHeaderSize = 9;

// A reader accepts any minor version of its own major version.
inline constexpr std::uint8_t kFormatVersionMajor = 1;
inline constexpr std::uint8_t kFormatVersionMinor = 0;

/// @brief Version byte: major in the high nibble, minor in the low nibble.
[[nodiscard]] constexpr std::uint8_t encodeVersion(std::uint8_t major, std::uint8_t minor) noexcept {
    return static_cast<std::uint8_t>((major << 4) | (minor & 0x0F));
}

[[nodiscard]] constexpr std::uint8_t decodeMajorVersion(std::uint8_t version) noexcept {
    return static_cast<std::uint8_t>(version >> 4);
}

[[nodiscard]] constexpr std::uint8_t decodeMinorVersion(std::uint8_t version) noexcept {
    return static_cast<std::uint8_t>(version & 0x0F);
}

inline constexpr std::uint8_t kCurrentVersion =
    encodeVersion(kFormatVersionMajor, kFormatVersionMinor);

// =============================================================================
// Header / Footer Constants
// =============================================================================

/// @brief Size of the fixed part of the header (before the delimiters).
/// @note headerSize + kMagicHeaderSize = offset of the first entry.
inline constexpr std::size_t kFixedHeaderSize = 4 + 4 + 8 + 8 + 8 + 4;

/// @brief Trailing marker; a missing marker means a truncated artifact.
inline constexpr std::array<std::uint8_t, 8> kMagicEnd = {
    'D', 'S', 'M', '_', 'E', 'O', 'F', '\0'
};

inline constexpr std::size_t kFileFooterSize = 16;

/// @brief Smallest possible artifact.
inline constexpr std::size_t kMinFileSize =
    kMagicHeaderSize + kFixedHeaderSize + 2 + 2 + kFileFooterSize;

// =============================================================================
// Field Limits
// =============================================================================

/// @brief Longest canonical value or variant (bytes).
inline constexpr std::uint32_t kMaxValueLength = 1U << 20;

/// @brief Largest number of variants per entry.
inline constexpr std::uint32_t kMaxVariantsPerEntry = 1U << 16;

// =============================================================================
// Header Flag Bit Definitions
// =============================================================================

namespace flags {

/// @brief Bit 0: the source contained bare TYPE_n text for a mapped type.
/// @note Bare-token decoding is refused for such artifacts.
inline constexpr std::uint32_t kSourceHasBareTokens = 1U << 0;

/// @brief Bit 1: a legend block was appended to the sanitized text.
inline constexpr std::uint32_t kHasLegend = 1U << 1;

/// @brief Bits that this version understands.
inline constexpr std::uint32_t kKnownMask = kSourceHasBareTokens | kHasLegend;

}  // namespace flags

// =============================================================================
// Validation Functions
// =============================================================================

[[nodiscard]] inline bool validateMagic(std::span<const std::uint8_t> data) noexcept {
    return data.size() >= kMagicBytes.size() &&
           std::equal(kMagicBytes.begin(), kMagicBytes.end(), data.begin());
}

[[nodiscard]] constexpr bool isVersionCompatible(std::uint8_t version) noexcept {
    return decodeMajorVersion(version) == kFormatVersionMajor;
}

/// @brief Same major version but a newer minor one (loads with a warning).
[[nodiscard]] constexpr bool isNewerMinorVersion(std::uint8_t version) noexcept {
    return isVersionCompatible(version) && decodeMinorVersion(version) > kFormatVersionMinor;
}

/// @brief Default file extension of mapping artifacts.
inline constexpr std::string_view kMappingExtension = ".dsm";

}  // namespace docsan::format

#endif  // DOCSAN_FORMAT_MAPPING_FORMAT_H
