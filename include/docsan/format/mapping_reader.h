// =============================================================================
// docsan - Mapping Artifact Reader
// =============================================================================
// Parses and validates .dsm mapping artifacts.
//
// Validation order:
//   1. size, magic bytes, version (major must match; newer minor warns)
//   2. footer end marker (truncation) and xxHash64 checksum (corruption)
//   3. header and entry structure
//   4. placeholder <-> entity bijection (MappingArtifact)
// Every failure is reported as MappingFileError.
// =============================================================================

#ifndef DOCSAN_FORMAT_MAPPING_READER_H
#define DOCSAN_FORMAT_MAPPING_READER_H

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>

#include "docsan/common/error.h"
#include "docsan/format/mapping.h"

namespace docsan::format {

class MappingReader {
public:
    /// @brief Parse an artifact from memory.
    /// @param origin Name used in error messages (usually the file path).
    /// @throws MappingFileError if the bytes are not a valid artifact.
    [[nodiscard]] static MappingArtifact parse(std::span<const std::uint8_t> bytes,
                                               std::string_view origin = {});

    /// @brief Load and parse an artifact file.
    /// @throws IOError (kFileNotFound) if the file does not exist.
    /// @throws MappingFileError if the file is not a valid artifact.
    [[nodiscard]] static MappingArtifact load(const std::filesystem::path& path);

    /// @brief Non-throwing variant of load().
    [[nodiscard]] static Result<MappingArtifact> tryLoad(const std::filesystem::path& path);
};

}  // namespace docsan::format

#endif  // DOCSAN_FORMAT_MAPPING_READER_H
