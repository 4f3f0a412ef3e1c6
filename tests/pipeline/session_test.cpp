// =============================================================================
// docsan - Encode / Decode Session Tests
// =============================================================================
// Scenario tests for the single-document state machines.
// =============================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

#include "docsan/algo/legend_generator.h"
#include "docsan/common/error.h"
#include "docsan/detect/pattern_detector.h"
#include "docsan/format/mapping_reader.h"
#include "docsan/pipeline/decode_session.h"
#include "docsan/pipeline/encode_session.h"

namespace docsan::pipeline::test {

namespace {

#define OPEN "\xE2\x9F\xA6"
#define CLOSE "\xE2\x9F\xA7"

const std::string kSource = "John Smith lives at 221B Baker Street, phone 555-1234.";
const std::string kSanitized =
    OPEN "PERSON_1" CLOSE " lives at " OPEN "STREET_1" CLOSE ", phone " OPEN "PHONE_1" CLOSE ".";

std::vector<Span> scenarioSpans() {
    return {
        Span{.start = 0, .end = 10, .type = "PERSON"},
        Span{.start = 20, .end = 37, .type = "STREET"},
        Span{.start = 45, .end = 53, .type = "PHONE"},
    };
}

std::filesystem::path tempFilePath() {
    static std::atomic<int> counter{0};
    std::random_device rd;
    return std::filesystem::temp_directory_path() /
           ("docsan_session_test_" + std::to_string(rd()) + "_" + std::to_string(counter++) +
            ".dsm");
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

}  // namespace

// =============================================================================
// Encode
// =============================================================================

TEST(EncodeSessionTest, Scenario) {
    EncodeSession session;
    EXPECT_EQ(session.state(), EncodeState::kRaw);

    const auto result = session.run(kSource, scenarioSpans());
    EXPECT_EQ(session.state(), EncodeState::kSanitized);
    EXPECT_EQ(result.sanitized, kSanitized);
    EXPECT_EQ(result.stats.entities, 3U);
    EXPECT_EQ(result.stats.occurrences, 3U);
    EXPECT_EQ(result.stats.sourceBytes, kSource.size());
    EXPECT_EQ(result.stats.sanitizedBytes, kSanitized.size());

    const auto& header = result.mapping.header();
    EXPECT_EQ(header.sourceFingerprint, format::fingerprint(kSource));
    EXPECT_EQ(header.sanitizedFingerprint, format::fingerprint(kSanitized));
    EXPECT_EQ(header.sourceLength, kSource.size());
    EXPECT_EQ(header.flags, 0U);

    const auto* street = result.mapping.findByPlaceholder("STREET_1");
    ASSERT_NE(street, nullptr);
    EXPECT_EQ(street->canonical, "221B Baker Street");
}

TEST(EncodeSessionTest, SameValueSharesPlaceholder) {
    const std::string source = "John Smith called. Later JOHN SMITH left.";
    EncodeSession session;
    const auto result = session.run(source, {Span{.start = 0, .end = 10, .type = "PERSON"}});

    EXPECT_EQ(result.sanitized, OPEN "PERSON_1" CLOSE " called. Later " OPEN "PERSON_1" CLOSE
                                    " left.");
    EXPECT_EQ(result.stats.swept, 1U);
    ASSERT_EQ(result.mapping.size(), 1U);
    EXPECT_EQ(result.mapping.entries()[0].occurrences, 2U);
    EXPECT_EQ(result.mapping.entries()[0].variants.size(), 2U);
}

TEST(EncodeSessionTest, IndexesFollowFirstOccurrence) {
    const std::string source = "Bob Stone met Alice Walker and Bob Stone";
    EncodeSession session;
    const auto result = session.run(source, {
                                                Span{.start = 14, .end = 26, .type = "PERSON"},
                                                Span{.start = 0, .end = 9, .type = "PERSON"},
                                            });
    EXPECT_EQ(result.sanitized, OPEN "PERSON_1" CLOSE " met " OPEN "PERSON_2" CLOSE " and " OPEN
                                    "PERSON_1" CLOSE);
    EXPECT_EQ(result.mapping.findByPlaceholder("PERSON_1")->canonical, "Bob Stone");
}

TEST(EncodeSessionTest, RunTwiceIsInvalidState) {
    EncodeSession session;
    (void)session.run(kSource, scenarioSpans());
    try {
        (void)session.run(kSource, scenarioSpans());
        FAIL() << "expected invalid state";
    } catch (const DocsanException& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::kInvalidState);
        EXPECT_NE(ex.message().find("sanitized"), std::string::npos);
    }
}

TEST(EncodeSessionTest, PersistBeforeRunIsInvalidState) {
    TempFileGuard guard(tempFilePath());
    EncodeSession session;
    EncodeResult empty;
    try {
        session.persist(empty, guard.path());
        FAIL() << "expected invalid state";
    } catch (const DocsanException& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::kInvalidState);
    }
    EXPECT_FALSE(std::filesystem::exists(guard.path()));
}

TEST(EncodeSessionTest, PersistWritesMapping) {
    TempFileGuard guard(tempFilePath());
    EncodeSession session;
    const auto result = session.run(kSource, scenarioSpans());
    session.persist(result, guard.path());

    EXPECT_EQ(session.state(), EncodeState::kMappingPersisted);
    EXPECT_EQ(format::MappingReader::load(guard.path()), result.mapping);
}

TEST(EncodeSessionTest, DelimiterCollisionFails) {
    EncodeSession session;
    const std::string source = "Reply to " OPEN "PERSON_1" CLOSE " please, John Smith";
    EXPECT_THROW((void)session.run(source, {Span{.start = 32, .end = 42, .type = "PERSON"}}),
                 PlaceholderCollisionError);
    EXPECT_EQ(session.state(), EncodeState::kFailed);
}

TEST(EncodeSessionTest, InvalidDelimitersAreUsageErrors) {
    EncodeOptions options;
    options.delimiters = algo::Delimiters{"", "]"};
    EncodeSession session(options);
    EXPECT_THROW((void)session.run("text", std::vector<Span>{}), UsageError);
    EXPECT_EQ(session.state(), EncodeState::kFailed);
}

TEST(EncodeSessionTest, LeakCheckCatchesMissedOccurrence) {
    EncodeOptions options;
    options.sweepVariants = false;
    EncodeSession session(options);

    const std::string source = "John Smith called. Later John Smith left.";
    try {
        (void)session.run(source, {Span{.start = 0, .end = 10, .type = "PERSON"}});
        FAIL() << "expected LeakDetectedError";
    } catch (const LeakDetectedError& ex) {
        EXPECT_NE(ex.message().find("PERSON value still present"), std::string::npos);
        EXPECT_EQ(ex.exitCode(), 9);
    }
    EXPECT_EQ(session.state(), EncodeState::kFailed);

    options.checkLeaks = false;
    EncodeSession lenient(options);
    const auto result = lenient.run(source, {Span{.start = 0, .end = 10, .type = "PERSON"}});
    EXPECT_NE(result.sanitized.find("John Smith"), std::string::npos);
}

TEST(EncodeSessionTest, RunWithDetector) {
    detect::PatternDetector detector;
    detect::DetectorScope scope(detector);

    EncodeSession session;
    const auto result = session.run("Mail alice@example.com or ALICE@EXAMPLE.COM", detector);
    EXPECT_EQ(result.sanitized, "Mail " OPEN "EMAIL_1" CLOSE " or " OPEN "EMAIL_1" CLOSE);
}

TEST(EncodeSessionTest, NoSpansPassesThrough) {
    EncodeSession session;
    const auto result = session.run(kSource, std::vector<Span>{});
    EXPECT_EQ(result.sanitized, kSource);
    EXPECT_TRUE(result.mapping.empty());
}

TEST(EncodeSessionTest, StateNames) {
    EXPECT_EQ(encodeStateToString(EncodeState::kPlaceholdersAllocated), "placeholders-allocated");
    EXPECT_EQ(encodeStateToString(EncodeState::kMappingPersisted), "mapping-persisted");
    EXPECT_EQ(decodeStateToString(DecodeState::kRestored), "restored");
    EXPECT_EQ(fingerprintCheckToString(FingerprintCheck::kMismatch), "mismatch");
}

// =============================================================================
// Decode
// =============================================================================

TEST(DecodeSessionTest, Scenario) {
    EncodeSession encoder;
    const auto encoded = encoder.run(kSource, scenarioSpans());

    DecodeSession decoder(encoded.mapping);
    const auto report = decoder.run(kSanitized);
    EXPECT_EQ(report.restored, kSource);
    EXPECT_TRUE(report.complete());
    EXPECT_EQ(report.resolvedCount, 3U);
    EXPECT_EQ(report.fingerprint, FingerprintCheck::kNotChecked);
    EXPECT_EQ(decoder.state(), DecodeState::kRestored);
}

TEST(DecodeSessionTest, UnknownPlaceholderIsReported) {
    EncodeSession encoder;
    const auto encoded = encoder.run(kSource, scenarioSpans());

    DecodeSession decoder(encoded.mapping);
    const auto report =
        decoder.run(OPEN "PERSON_1" CLOSE " met " OPEN "PERSON_9" CLOSE " at " OPEN "STREET_1" CLOSE ".");
    EXPECT_EQ(report.restored, "John Smith met " OPEN "PERSON_9" CLOSE " at 221B Baker Street.");
    EXPECT_FALSE(report.complete());
    ASSERT_EQ(report.unresolved.size(), 1U);
    EXPECT_EQ(report.unresolved[0].token, "PERSON_9");
}

TEST(DecodeSessionTest, RunTwiceIsInvalidState) {
    DecodeSession decoder{format::MappingArtifact{}};
    (void)decoder.run("text");
    EXPECT_THROW((void)decoder.run("text"), DocsanException);
}

TEST(DecodeSessionTest, FingerprintCheck) {
    EncodeSession encoder;
    const auto encoded = encoder.run(kSource, scenarioSpans());

    DecodeSession match(encoded.mapping);
    EXPECT_EQ(match.run(kSanitized, kSource).fingerprint, FingerprintCheck::kMatch);

    DecodeSession mismatch(encoded.mapping);
    const auto report = mismatch.run(kSanitized, std::string_view("a different document"));
    EXPECT_EQ(report.fingerprint, FingerprintCheck::kMismatch);
    // Restoration still happens
    EXPECT_EQ(report.restored, kSource);
}

TEST(DecodeSessionTest, LegendIsAppendedAndStripped) {
    EncodeOptions options;
    options.appendLegend = true;
    EncodeSession encoder(options);
    const auto encoded = encoder.run(kSource, scenarioSpans());

    EXPECT_TRUE(encoded.mapping.header().hasLegend());
    EXPECT_NE(encoded.sanitized.find(algo::kLegendBeginMarker), std::string::npos);
    EXPECT_EQ(encoded.sanitized.find("John Smith"), std::string::npos);

    DecodeSession keep(encoded.mapping);
    EXPECT_NE(keep.run(encoded.sanitized).restored, kSource);

    DecodeOptions strip;
    strip.stripLegend = true;
    DecodeSession stripped(encoded.mapping, strip);
    EXPECT_EQ(stripped.run(encoded.sanitized).restored, kSource);
}

TEST(DecodeSessionTest, BareTokensRefusedWhenSourceHadThem) {
    const std::string source = "Ticket PERSON_2 is assigned to John Smith";
    EncodeSession encoder;
    const auto encoded = encoder.run(source, {Span{.start = 31, .end = 41, .type = "PERSON"}});
    EXPECT_TRUE(encoded.stats.sourceHasBareTokens);
    EXPECT_TRUE(encoded.mapping.header().sourceHasBareTokens());

    DecodeOptions options;
    options.tolerance.matchBareTokens = true;
    DecodeSession decoder(encoded.mapping, options);
    const auto report = decoder.run("Ticket PERSON_2 is assigned to PERSON_1");
    EXPECT_TRUE(report.bareTokensRefused);
    EXPECT_EQ(report.restored, "Ticket PERSON_2 is assigned to PERSON_1");
}

TEST(DecodeSessionTest, BareTokensAcceptedOtherwise) {
    EncodeSession encoder;
    const auto encoded = encoder.run(kSource, scenarioSpans());

    DecodeOptions options;
    options.tolerance.matchBareTokens = true;
    DecodeSession decoder(encoded.mapping, options);
    const auto report = decoder.run("Call PERSON_1 on PHONE_1.");
    EXPECT_FALSE(report.bareTokensRefused);
    EXPECT_EQ(report.restored, "Call John Smith on 555-1234.");
}

TEST(DecodeSessionTest, LoadFromFile) {
    TempFileGuard guard(tempFilePath());
    EncodeSession encoder;
    const auto encoded = encoder.run(kSource, scenarioSpans());
    encoder.persist(encoded, guard.path());

    auto decoder = DecodeSession::load(guard.path());
    EXPECT_EQ(decoder.mapping(), encoded.mapping);
    EXPECT_EQ(decoder.run(kSanitized).restored, kSource);
}

TEST(DecodeSessionTest, LoadMissingMappingFails) {
    EXPECT_THROW((void)DecodeSession::load(tempFilePath()), MappingFileError);
}

#undef OPEN
#undef CLOSE

}  // namespace docsan::pipeline::test
