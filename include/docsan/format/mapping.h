// =============================================================================
// docsan - Mapping Artifact Model
// =============================================================================
// In-memory form of the mapping artifact: one entry per placeholder plus the
// header fields needed to verify it at decode time.
//
// A MappingArtifact is immutable once constructed. Construction validates the
// placeholder <-> entity bijection and builds the lookup indexes:
// - placeholder core ("PERSON_1") -> entry
// - surface variant -> placeholder core
// =============================================================================

#ifndef DOCSAN_FORMAT_MAPPING_H
#define DOCSAN_FORMAT_MAPPING_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "docsan/algo/placeholder.h"
#include "docsan/common/error.h"
#include "docsan/common/types.h"
#include "docsan/format/mapping_format.h"

namespace docsan::format {

/// @brief One placeholder and the entity it stands for.
struct MappingEntry {
    PlaceholderIndex index = 0;
    std::string type;
    std::string canonical;
    std::uint32_t occurrences = 0;

    /// @brief Observed surface variants, sorted and unique.
    std::vector<std::string> variants;

    /// @brief "TYPE_n".
    [[nodiscard]] std::string core() const { return algo::formatCore(type, index); }

    bool operator==(const MappingEntry& other) const = default;
};

/// @brief Header fields of a mapping artifact.
struct MappingHeader {
    std::uint8_t version = kCurrentVersion;
    std::uint32_t flags = 0;
    Checksum sourceFingerprint = 0;
    Checksum sanitizedFingerprint = 0;
    std::uint64_t sourceLength = 0;
    algo::Delimiters delimiters;

    [[nodiscard]] bool sourceHasBareTokens() const noexcept {
        return (flags & flags::kSourceHasBareTokens) != 0;
    }

    [[nodiscard]] bool hasLegend() const noexcept { return (flags & flags::kHasLegend) != 0; }

    bool operator==(const MappingHeader& other) const = default;
};

/// @brief xxHash64 (seed 0) of a text, used for source/sanitized fingerprints.
[[nodiscard]] Checksum fingerprint(std::string_view text) noexcept;

class MappingArtifact {
public:
    /// @brief Empty artifact (no entries, default header).
    MappingArtifact() = default;

    /// @brief Build and validate an artifact.
    /// @throws MappingFileError if validation fails.
    MappingArtifact(MappingHeader header, std::vector<MappingEntry> entries);

    /// @brief Non-throwing variant of the constructor.
    [[nodiscard]] static Result<MappingArtifact> create(MappingHeader header,
                                                        std::vector<MappingEntry> entries);

    [[nodiscard]] const MappingHeader& header() const noexcept { return header_; }

    /// @brief Entries in allocation order.
    [[nodiscard]] std::span<const MappingEntry> entries() const noexcept { return entries_; }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// @brief Entry for a normalized core token ("PERSON_1"), or nullptr.
    [[nodiscard]] const MappingEntry* findByPlaceholder(std::string_view core) const;

    /// @brief Placeholder core for an exact surface variant, or nullptr.
    /// @note A variant shared by entities of different types maps to the
    ///       first such entry.
    [[nodiscard]] const std::string* findByVariant(std::string_view variant) const;

    /// @brief Lookup table for the reverse pass.
    [[nodiscard]] algo::PlaceholderTable placeholderTable() const;

    /// @brief Entity count per type tag.
    [[nodiscard]] std::map<std::string, std::size_t, std::less<>> countByType() const;

    bool operator==(const MappingArtifact& other) const {
        return header_ == other.header_ && entries_ == other.entries_;
    }

private:
    /// @brief Check bijection and build indexes.
    [[nodiscard]] VoidResult buildIndexes();

    MappingHeader header_;
    std::vector<MappingEntry> entries_;
    std::unordered_map<std::string, std::size_t> byPlaceholder_;
    std::unordered_map<std::string, std::string> byVariant_;
};

}  // namespace docsan::format

#endif  // DOCSAN_FORMAT_MAPPING_H
