// =============================================================================
// docsan - Mapping Artifact Format Property Tests
// =============================================================================
// Property-based tests for the .dsm mapping artifact:
// - serialize/parse reproduces the artifact
// - serialization is deterministic
// - any single corrupted or truncated byte range is rejected
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <atomic>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "docsan/algo/entity_normalizer.h"
#include "docsan/common/error.h"
#include "docsan/format/mapping.h"
#include "docsan/format/mapping_format.h"
#include "docsan/format/mapping_reader.h"
#include "docsan/format/mapping_writer.h"

namespace docsan::format::test {

// =============================================================================
// Test Utilities
// =============================================================================

namespace {

std::filesystem::path tempFilePath() {
    static std::atomic<int> counter{0};
    std::random_device rd;
    return std::filesystem::temp_directory_path() /
           ("docsan_mapping_test_" + std::to_string(rd()) + "_" + std::to_string(counter++) +
            std::string(kMappingExtension));
}

class TempFileGuard {
public:
    explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

/// @brief Rewrite the footer checksum after patching header bytes.
void resealChecksum(std::vector<std::uint8_t>& bytes) {
    const std::size_t footerPos = bytes.size() - kFileFooterSize;
    const std::uint64_t checksum =
        fingerprint(std::string_view(reinterpret_cast<const char*>(bytes.data()), footerPos));
    for (std::size_t i = 0; i < 8; ++i) {
        bytes[footerPos + i] = static_cast<std::uint8_t>(checksum >> (8 * i));
    }
}

MappingArtifact sampleArtifact() {
    MappingHeader header;
    header.sourceFingerprint = fingerprint("John Smith lives at 221B Baker Street");
    header.sanitizedFingerprint = fingerprint("sanitized");
    header.sourceLength = 37;

    std::vector<MappingEntry> entries = {
        {.index = 1, .type = "PERSON", .canonical = "John Smith", .occurrences = 2,
         .variants = {"John Smith", "JOHN SMITH"}},
        {.index = 1, .type = "STREET", .canonical = "221B Baker Street", .occurrences = 1,
         .variants = {"221B Baker Street"}},
    };
    return MappingArtifact(header, std::move(entries));
}

}  // namespace

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

[[nodiscard]] rc::Gen<std::string> value() {
    return rc::gen::nonEmpty(rc::gen::container<std::string>(
        rc::gen::elementOf(std::vector<char>{'a', 'b', 'c', 'D', 'E', ' ', '-', '7'})));
}

[[nodiscard]] rc::Gen<std::string> typeTag() {
    return rc::gen::elementOf(std::vector<std::string>{"PERSON", "PHONE", "ORG", "CUSTOM_TAG"});
}

[[nodiscard]] rc::Gen<algo::Delimiters> delimiters() {
    return rc::gen::elementOf(std::vector<algo::Delimiters>{
        algo::Delimiters{}, algo::Delimiters{"[[", "]]"}, algo::Delimiters{"<<", ">>"}});
}

/// @brief A valid artifact: per-type indexes 1..n, distinct normalized values.
[[nodiscard]] rc::Gen<MappingArtifact> artifact() {
    return rc::gen::apply(
        [](std::vector<std::pair<std::string, std::string>> values, algo::Delimiters delimiters,
           std::uint32_t flags, std::uint64_t sourceFp, std::uint64_t sanitizedFp,
           std::uint32_t sourceLength) {
            MappingHeader header;
            header.flags = flags & flags::kKnownMask;
            header.sourceFingerprint = sourceFp;
            header.sanitizedFingerprint = sanitizedFp;
            header.sourceLength = sourceLength;
            header.delimiters = std::move(delimiters);

            std::set<std::pair<std::string, std::string>> seen;
            std::map<std::string, PlaceholderIndex> next;
            std::vector<MappingEntry> entries;
            for (auto& [type, canonical] : values) {
                if (!seen.emplace(type, algo::normalizeValue(type, canonical)).second ||
                    algo::normalizeValue(type, canonical).empty()) {
                    continue;
                }
                MappingEntry entry;
                entry.index = ++next[type];
                entry.type = type;
                entry.canonical = canonical;
                entry.occurrences = static_cast<std::uint32_t>(canonical.size());
                entry.variants = {canonical, canonical + " x"};
                entries.push_back(std::move(entry));
            }
            return MappingArtifact(header, std::move(entries));
        },
        rc::gen::container<std::vector<std::pair<std::string, std::string>>>(
            rc::gen::pair(typeTag(), value())),
        delimiters(), rc::gen::arbitrary<std::uint32_t>(), rc::gen::arbitrary<std::uint64_t>(),
        rc::gen::arbitrary<std::uint64_t>(), rc::gen::arbitrary<std::uint32_t>());
}

}  // namespace gen

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(MappingFormatProperty, ParseInvertsSerialize, ()) {
    const auto artifact = *gen::artifact();
    const auto bytes = MappingWriter::serialize(artifact);
    const auto parsed = MappingReader::parse(bytes, "memory");

    RC_ASSERT(parsed == artifact);
    for (const auto& entry : artifact.entries()) {
        const auto* found = parsed.findByPlaceholder(entry.core());
        RC_ASSERT(found != nullptr);
        RC_ASSERT(found->canonical == entry.canonical);
    }
}

RC_GTEST_PROP(MappingFormatProperty, SerializationIsDeterministic, ()) {
    const auto artifact = *gen::artifact();
    const auto copy = artifact;
    RC_ASSERT(MappingWriter::serialize(artifact) == MappingWriter::serialize(copy));
}

RC_GTEST_PROP(MappingFormatProperty, CorruptedByteIsRejected, ()) {
    auto bytes = MappingWriter::serialize(*gen::artifact());
    const auto pos = *rc::gen::inRange<std::size_t>(0, bytes.size());
    const auto mask = *rc::gen::inRange<int>(1, 256);
    bytes[pos] ^= static_cast<std::uint8_t>(mask);

    RC_ASSERT_THROWS_AS((void)MappingReader::parse(bytes, "corrupt"), MappingFileError);
}

RC_GTEST_PROP(MappingFormatProperty, TruncatedArtifactIsRejected, ()) {
    const auto bytes = MappingWriter::serialize(*gen::artifact());
    const auto keep = *rc::gen::inRange<std::size_t>(0, bytes.size());
    const std::span<const std::uint8_t> prefix(bytes.data(), keep);

    RC_ASSERT_THROWS_AS((void)MappingReader::parse(prefix, "truncated"), MappingFileError);
}

// =============================================================================
// Unit Tests
// =============================================================================

TEST(MappingFormatTest, VersionEncoding) {
    EXPECT_EQ(decodeMajorVersion(kCurrentVersion), kFormatVersionMajor);
    EXPECT_EQ(decodeMinorVersion(kCurrentVersion), kFormatVersionMinor);
    EXPECT_TRUE(isVersionCompatible(encodeVersion(1, 5)));
    EXPECT_FALSE(isVersionCompatible(encodeVersion(2, 0)));
    EXPECT_TRUE(isNewerMinorVersion(encodeVersion(1, 1)));
    EXPECT_FALSE(isNewerMinorVersion(kCurrentVersion));
    EXPECT_FALSE(isNewerMinorVersion(encodeVersion(2, 1)));
}

TEST(MappingFormatTest, IncompatibleMajorVersionRejected) {
    auto bytes = MappingWriter::serialize(sampleArtifact());
    bytes[kMagicBytes.size()] = encodeVersion(2, 0);
    resealChecksum(bytes);

    try {
        (void)MappingReader::parse(bytes, "v2.dsm");
        FAIL() << "expected MappingFileError";
    } catch (const MappingFileError& ex) {
        EXPECT_NE(ex.message().find("unsupported mapping format version 2.0"), std::string::npos);
    }
}

TEST(MappingFormatTest, NewerMinorVersionAccepted) {
    auto bytes = MappingWriter::serialize(sampleArtifact());
    bytes[kMagicBytes.size()] = encodeVersion(kFormatVersionMajor, kFormatVersionMinor + 1);
    resealChecksum(bytes);

    const auto parsed = MappingReader::parse(bytes, "newer.dsm");
    EXPECT_EQ(parsed.size(), 2U);
}

TEST(MappingFormatTest, BadMagicRejected) {
    auto bytes = MappingWriter::serialize(sampleArtifact());
    bytes[1] = 'X';
    try {
        (void)MappingReader::parse(bytes, "bad.dsm");
        FAIL() << "expected MappingFileError";
    } catch (const MappingFileError& ex) {
        EXPECT_NE(ex.message().find("bad magic"), std::string::npos);
        EXPECT_EQ(ex.exitCode(), 3);
    }
}

TEST(MappingFormatTest, ChecksumMismatchReportsBothValues) {
    auto bytes = MappingWriter::serialize(sampleArtifact());
    bytes[kMagicHeaderSize + 4] ^= 0x01;  // flags
    try {
        (void)MappingReader::parse(bytes, "flip.dsm");
        FAIL() << "expected MappingFileError";
    } catch (const MappingFileError& ex) {
        EXPECT_TRUE(ex.expected().has_value());
        EXPECT_TRUE(ex.actual().has_value());
        EXPECT_NE(*ex.expected(), *ex.actual());
    }
}

TEST(MappingFormatTest, HeaderFieldsSurvive) {
    const auto artifact = sampleArtifact();
    const auto parsed = MappingReader::parse(MappingWriter::serialize(artifact));
    EXPECT_EQ(parsed.header().sourceLength, 37U);
    EXPECT_EQ(parsed.header().sourceFingerprint, artifact.header().sourceFingerprint);
    EXPECT_EQ(parsed.header().delimiters, algo::Delimiters{});
    EXPECT_FALSE(parsed.header().sourceHasBareTokens());
    EXPECT_FALSE(parsed.header().hasLegend());
}

// =============================================================================
// Artifact Model
// =============================================================================

TEST(MappingArtifactTest, LookupsAndCounts) {
    const auto artifact = sampleArtifact();

    const auto* person = artifact.findByPlaceholder("PERSON_1");
    ASSERT_NE(person, nullptr);
    EXPECT_EQ(person->canonical, "John Smith");
    // Variants come back sorted
    EXPECT_EQ(person->variants, (std::vector<std::string>{"JOHN SMITH", "John Smith"}));

    ASSERT_NE(artifact.findByVariant("JOHN SMITH"), nullptr);
    EXPECT_EQ(*artifact.findByVariant("JOHN SMITH"), "PERSON_1");
    EXPECT_EQ(artifact.findByVariant("Jane"), nullptr);

    const auto counts = artifact.countByType();
    EXPECT_EQ(counts.at("PERSON"), 1U);
    EXPECT_EQ(counts.at("STREET"), 1U);

    const auto table = artifact.placeholderTable();
    ASSERT_NE(table.find("STREET_1"), nullptr);
    EXPECT_EQ(*table.find("STREET_1"), "221B Baker Street");
}

TEST(MappingArtifactTest, DuplicatePlaceholderRejected) {
    std::vector<MappingEntry> entries = {
        {.index = 1, .type = "PERSON", .canonical = "Ann"},
        {.index = 1, .type = "PERSON", .canonical = "Ben"},
    };
    EXPECT_THROW(MappingArtifact(MappingHeader{}, entries), MappingFileError);
}

TEST(MappingArtifactTest, DuplicateValueRejected) {
    std::vector<MappingEntry> entries = {
        {.index = 1, .type = "PERSON", .canonical = "Ann Lee"},
        {.index = 2, .type = "PERSON", .canonical = "ANN LEE"},
    };
    auto result = MappingArtifact::create(MappingHeader{}, entries);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kMappingFileError);
}

TEST(MappingArtifactTest, SameValueDifferentTypesAllowed) {
    std::vector<MappingEntry> entries = {
        {.index = 1, .type = "PERSON", .canonical = "Jordan"},
        {.index = 1, .type = "PLACE", .canonical = "Jordan"},
    };
    EXPECT_TRUE(MappingArtifact::create(MappingHeader{}, entries).has_value());
}

TEST(MappingArtifactTest, InvalidEntriesRejected) {
    auto accepts = [](MappingEntry entry) {
        return MappingArtifact::create(MappingHeader{}, std::vector<MappingEntry>{std::move(entry)})
            .has_value();
    };
    EXPECT_TRUE(accepts(MappingEntry{.index = 1, .type = "PERSON", .canonical = "Ann"}));
    EXPECT_FALSE(accepts(MappingEntry{.index = 0, .type = "PERSON", .canonical = "Ann"}));
    EXPECT_FALSE(accepts(MappingEntry{.index = 1, .type = "person", .canonical = "Ann"}));
    EXPECT_FALSE(accepts(MappingEntry{.index = 1, .type = "PERSON", .canonical = ""}));
}

TEST(MappingArtifactTest, InvalidDelimitersRejected) {
    MappingHeader header;
    header.delimiters = algo::Delimiters{"", "]"};
    EXPECT_FALSE(MappingArtifact::create(header, {}).has_value());
}

// =============================================================================
// File I/O
// =============================================================================

TEST(MappingFileTest, WriteThenLoad) {
    TempFileGuard guard(tempFilePath());
    const auto artifact = sampleArtifact();

    MappingWriter(guard.path()).write(artifact);
    EXPECT_EQ(MappingReader::load(guard.path()), artifact);

    // Existing artifacts are never replaced silently
    EXPECT_THROW(MappingWriter(guard.path()).write(artifact), IOError);
    EXPECT_NO_THROW(MappingWriter(guard.path(), true).write(artifact));
}

TEST(MappingFileTest, TryLoadReportsMissingFile) {
    auto result = MappingReader::tryLoad(tempFilePath());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFileNotFound);
}

TEST(MappingFileTest, NonArtifactFileRejected) {
    TempFileGuard guard(tempFilePath());
    {
        std::ofstream out(guard.path(), std::ios::binary);
        out << "PERSON_1\tJohn Smith\n";
    }
    EXPECT_THROW((void)MappingReader::load(guard.path()), MappingFileError);
}

}  // namespace docsan::format::test
