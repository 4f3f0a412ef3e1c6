// =============================================================================
// docsan - Mapping Artifact Reader Implementation
// =============================================================================

#include "docsan/format/mapping_reader.h"

#include <algorithm>
#include <bit>
#include <cstring>
#include <format>
#include <string>
#include <type_traits>
#include <vector>

#include <xxhash.h>

#include "docsan/common/logger.h"
#include "docsan/io/text_file.h"

namespace docsan::format {

namespace {

/// @brief Bounds-checked little-endian cursor over the artifact body.
class ByteReader {
public:
    ByteReader(std::span<const std::uint8_t> bytes, std::size_t pos, std::size_t end,
               std::string_view origin)
        : bytes_(bytes), pos_(pos), end_(end), origin_(origin) {}

    template <typename T>
    T readLE(std::string_view field) {
        static_assert(std::is_trivially_copyable_v<T>, "Type must be trivially copyable");
        require(sizeof(T), field);

        T value;
        std::memcpy(&value, bytes_.data() + pos_, sizeof(T));
        pos_ += sizeof(T);

        // Convert from little-endian if necessary
        if constexpr (std::endian::native == std::endian::big) {
            if constexpr (sizeof(T) == 2) {
                value = static_cast<T>(__builtin_bswap16(static_cast<std::uint16_t>(value)));
            } else if constexpr (sizeof(T) == 4) {
                value = static_cast<T>(__builtin_bswap32(static_cast<std::uint32_t>(value)));
            } else if constexpr (sizeof(T) == 8) {
                value = static_cast<T>(__builtin_bswap64(static_cast<std::uint64_t>(value)));
            }
        }
        return value;
    }

    template <typename LengthT>
    std::string readString(std::uint32_t limit, std::string_view field) {
        const auto length = readLE<LengthT>(field);
        if (length > limit) {
            fail(std::format("{} length {} exceeds limit {}", field, length, limit));
        }
        require(length, field);
        std::string value(reinterpret_cast<const char*>(bytes_.data() + pos_), length);
        pos_ += length;
        return value;
    }

    void seek(std::size_t pos, std::string_view field) {
        if (pos > end_) {
            fail(std::format("{} points past the end of the data", field));
        }
        pos_ = pos;
    }

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

    [[noreturn]] void fail(const std::string& message) const {
        throw MappingFileError(message, ErrorContext(std::string(origin_)).withOffset(pos_));
    }

private:
    void require(std::size_t size, std::string_view field) const {
        if (size > end_ - pos_) {
            fail(std::format("truncated artifact while reading {}", field));
        }
    }

    std::span<const std::uint8_t> bytes_;
    std::size_t pos_;
    std::size_t end_;
    std::string_view origin_;
};

}  // namespace

MappingArtifact MappingReader::parse(std::span<const std::uint8_t> bytes, std::string_view origin) {
    const std::string originName(origin);

    if (bytes.size() < kMinFileSize) {
        throw MappingFileError(
            std::format("file too small to be a mapping artifact ({} bytes)", bytes.size()),
            ErrorContext(originName));
    }
    if (!validateMagic(bytes)) {
        throw MappingFileError("not a docsan mapping artifact (bad magic bytes)",
                               ErrorContext(originName));
    }

    const std::uint8_t version = bytes[kMagicBytes.size()];
    if (!isVersionCompatible(version)) {
        throw MappingFileError(std::format("unsupported mapping format version {}.{} (expected {}.x)",
                                           decodeMajorVersion(version), decodeMinorVersion(version),
                                           kFormatVersionMajor),
                               ErrorContext(originName));
    }
    if (isNewerMinorVersion(version)) {
        DOCSAN_LOG_WARNING("Mapping {} uses newer format version {}.{}; unknown fields are ignored",
                           originName, decodeMajorVersion(version), decodeMinorVersion(version));
    }

    // Footer: truncation first, then corruption
    const std::size_t footerPos = bytes.size() - kFileFooterSize;
    if (std::memcmp(bytes.data() + footerPos + 8, kMagicEnd.data(), kMagicEnd.size()) != 0) {
        throw MappingFileError("mapping artifact is truncated (end marker missing)",
                               ErrorContext(originName));
    }
    {
        ByteReader footer(bytes, footerPos, footerPos + 8, origin);
        const auto stored = footer.readLE<std::uint64_t>("checksum");
        const auto actual = XXH64(bytes.data(), footerPos, 0);
        if (stored != actual) {
            throw MappingFileError(stored, actual, ErrorContext(originName));
        }
    }

    ByteReader reader(bytes, kMagicHeaderSize, footerPos, origin);

    // Header
    MappingHeader header;
    header.version = version;
    const auto headerSize = reader.readLE<std::uint32_t>("header size");
    if (headerSize < kFixedHeaderSize + 4) {
        reader.fail(std::format("header size {} is too small", headerSize));
    }
    header.flags = reader.readLE<std::uint32_t>("flags");
    header.sourceFingerprint = reader.readLE<std::uint64_t>("source fingerprint");
    header.sanitizedFingerprint = reader.readLE<std::uint64_t>("sanitized fingerprint");
    header.sourceLength = reader.readLE<std::uint64_t>("source length");
    const auto entryCount = reader.readLE<std::uint32_t>("entry count");
    header.delimiters.open =
        reader.readString<std::uint16_t>(algo::kMaxDelimiterLength, "opening delimiter");
    header.delimiters.close =
        reader.readString<std::uint16_t>(algo::kMaxDelimiterLength, "closing delimiter");

    if ((header.flags & ~flags::kKnownMask) != 0) {
        DOCSAN_LOG_WARNING("Mapping {} sets unknown flags 0x{:08x}", originName,
                           header.flags & ~flags::kKnownMask);
    }

    const std::size_t entriesStart = kMagicHeaderSize + headerSize;
    if (entriesStart < reader.position()) {
        reader.fail("header size is smaller than the header fields");
    }
    reader.seek(entriesStart, "header size");

    // Entries
    std::vector<MappingEntry> entries;
    entries.reserve(std::min<std::size_t>(entryCount, (footerPos - entriesStart) / 16 + 1));
    for (std::uint32_t i = 0; i < entryCount; ++i) {
        MappingEntry entry;
        entry.index = reader.readLE<std::uint32_t>("placeholder index");
        entry.type = reader.readString<std::uint16_t>(kMaxTypeTagLength, "type tag");
        entry.canonical = reader.readString<std::uint32_t>(kMaxValueLength, "canonical value");
        entry.occurrences = reader.readLE<std::uint32_t>("occurrence count");
        const auto variantCount = reader.readLE<std::uint32_t>("variant count");
        if (variantCount > kMaxVariantsPerEntry) {
            reader.fail(std::format("entry {} has too many variants ({})", i, variantCount));
        }
        entry.variants.reserve(variantCount);
        for (std::uint32_t v = 0; v < variantCount; ++v) {
            entry.variants.push_back(
                reader.readString<std::uint32_t>(kMaxValueLength, "surface variant"));
        }
        entries.push_back(std::move(entry));
    }

    if (reader.position() != footerPos) {
        reader.fail(std::format("{} unexpected bytes after the last entry",
                                footerPos - reader.position()));
    }

    auto artifact = MappingArtifact::create(std::move(header), std::move(entries));
    if (!artifact) {
        throw MappingFileError(artifact.error().message(), ErrorContext(originName));
    }

    DOCSAN_LOG_DEBUG("Mapping parsed: {}, version {}.{}, placeholders={}", originName,
                     decodeMajorVersion(version), decodeMinorVersion(version), artifact->size());
    return std::move(*artifact);
}

MappingArtifact MappingReader::load(const std::filesystem::path& path) {
    const auto bytes = io::readBinaryFile(path);
    return parse(bytes, path.string());
}

Result<MappingArtifact> MappingReader::tryLoad(const std::filesystem::path& path) {
    return tryExecute([&path]() { return load(path); });
}

}  // namespace docsan::format
