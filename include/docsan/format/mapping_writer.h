// =============================================================================
// docsan - Mapping Artifact Writer
// =============================================================================
// Serializes a MappingArtifact into the .dsm binary layout and writes it
// atomically (temporary file + rename).
//
// The whole record is built in memory first; the file system only sees the
// finished bytes.
// =============================================================================

#ifndef DOCSAN_FORMAT_MAPPING_WRITER_H
#define DOCSAN_FORMAT_MAPPING_WRITER_H

#include <cstdint>
#include <filesystem>
#include <vector>

#include "docsan/format/mapping.h"

namespace docsan::format {

class MappingWriter {
public:
    /// @param outputPath Final artifact path.
    /// @param overwrite Allow replacing an existing artifact.
    explicit MappingWriter(std::filesystem::path outputPath, bool overwrite = false)
        : outputPath_(std::move(outputPath)), overwrite_(overwrite) {}

    /// @brief Serialize and atomically write an artifact.
    /// @throws MappingFileError if a field exceeds the format limits.
    /// @throws IOError on write failure (no partial file is left behind).
    void write(const MappingArtifact& artifact) const;

    /// @brief Serialize an artifact including the checksummed footer.
    [[nodiscard]] static std::vector<std::uint8_t> serialize(const MappingArtifact& artifact);

private:
    std::filesystem::path outputPath_;
    bool overwrite_;
};

}  // namespace docsan::format

#endif  // DOCSAN_FORMAT_MAPPING_WRITER_H
