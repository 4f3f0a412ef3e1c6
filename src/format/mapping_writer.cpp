// =============================================================================
// docsan - Mapping Artifact Writer Implementation
// =============================================================================

#include "docsan/format/mapping_writer.h"

#include <bit>
#include <format>
#include <limits>
#include <span>
#include <string_view>
#include <type_traits>

#include <xxhash.h>

#include "docsan/common/logger.h"
#include "docsan/io/atomic_file.h"

namespace docsan::format {

namespace {

/// @brief Little-endian append-only byte buffer.
class ByteWriter {
public:
    explicit ByteWriter(std::vector<std::uint8_t>& out) : out_(out) {}

    template <typename T>
    void writeLE(T value) {
        static_assert(std::is_trivially_copyable_v<T>, "Type must be trivially copyable");

        // Convert to little-endian if necessary
        if constexpr (std::endian::native == std::endian::big) {
            if constexpr (sizeof(T) == 2) {
                value = static_cast<T>(__builtin_bswap16(static_cast<std::uint16_t>(value)));
            } else if constexpr (sizeof(T) == 4) {
                value = static_cast<T>(__builtin_bswap32(static_cast<std::uint32_t>(value)));
            } else if constexpr (sizeof(T) == 8) {
                value = static_cast<T>(__builtin_bswap64(static_cast<std::uint64_t>(value)));
            }
        }

        const auto* bytes = reinterpret_cast<const std::uint8_t*>(&value);
        out_.insert(out_.end(), bytes, bytes + sizeof(T));
    }

    /// @brief Length-prefixed string.
    template <typename LengthT>
    void writeString(std::string_view text, std::uint32_t limit, std::string_view field) {
        if (text.size() > limit || text.size() > std::numeric_limits<LengthT>::max()) {
            throw MappingFileError(
                std::format("{} is too long for the mapping format ({} bytes)", field, text.size()));
        }
        writeLE(static_cast<LengthT>(text.size()));
        out_.insert(out_.end(), text.begin(), text.end());
    }

    void writeBytes(std::span<const std::uint8_t> bytes) {
        out_.insert(out_.end(), bytes.begin(), bytes.end());
    }

private:
    std::vector<std::uint8_t>& out_;
};

}  // namespace

std::vector<std::uint8_t> MappingWriter::serialize(const MappingArtifact& artifact) {
    const auto& header = artifact.header();
    const auto& delimiters = header.delimiters;

    std::vector<std::uint8_t> out;
    out.reserve(kMinFileSize + artifact.size() * 64);
    ByteWriter writer(out);

    // Magic header
    writer.writeBytes(kMagicBytes);
    writer.writeLE(kCurrentVersion);

    // Header
    const auto headerSize = static_cast<std::uint32_t>(kFixedHeaderSize + 2 + delimiters.open.size() +
                                                       2 + delimiters.close.size());
    writer.writeLE(headerSize);
    writer.writeLE(header.flags);
    writer.writeLE(header.sourceFingerprint);
    writer.writeLE(header.sanitizedFingerprint);
    writer.writeLE(header.sourceLength);
    writer.writeLE(static_cast<std::uint32_t>(artifact.size()));
    writer.writeString<std::uint16_t>(delimiters.open, algo::kMaxDelimiterLength, "opening delimiter");
    writer.writeString<std::uint16_t>(delimiters.close, algo::kMaxDelimiterLength,
                                      "closing delimiter");

    // Entries
    for (const auto& entry : artifact.entries()) {
        if (entry.variants.size() > kMaxVariantsPerEntry) {
            throw MappingFileError(std::format("placeholder {} has too many variants ({})",
                                               entry.core(), entry.variants.size()));
        }
        writer.writeLE(static_cast<std::uint32_t>(entry.index));
        writer.writeString<std::uint16_t>(entry.type, kMaxTypeTagLength, "type tag");
        writer.writeString<std::uint32_t>(entry.canonical, kMaxValueLength, "canonical value");
        writer.writeLE(entry.occurrences);
        writer.writeLE(static_cast<std::uint32_t>(entry.variants.size()));
        for (const auto& variant : entry.variants) {
            writer.writeString<std::uint32_t>(variant, kMaxValueLength, "surface variant");
        }
    }

    // Footer (checksum covers everything before it)
    const std::uint64_t checksum = XXH64(out.data(), out.size(), 0);
    writer.writeLE(checksum);
    writer.writeBytes(kMagicEnd);

    return out;
}

void MappingWriter::write(const MappingArtifact& artifact) const {
    const auto bytes = serialize(artifact);

    io::AtomicFileWriter file(outputPath_, overwrite_);
    file.write(std::span<const std::uint8_t>(bytes));
    file.commit();

    DOCSAN_LOG_INFO("Mapping written: {}, placeholders={}, bytes={}", outputPath_.string(),
                    artifact.size(), bytes.size());
}

}  // namespace docsan::format
