// =============================================================================
// docsan - Pattern Detector Tests
// =============================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "docsan/algo/span_resolver.h"
#include "docsan/common/error.h"
#include "docsan/detect/pattern_detector.h"

namespace docsan::detect::test {

namespace {

/// @brief Scan and resolve, as the encoder does.
std::vector<Span> detect(std::string_view text, PatternOptions options = {}) {
    PatternDetector detector(options);
    DetectorScope scope(detector);
    return algo::SpanResolver{}.resolve(text, scope.detector().scan(text));
}

const Span* findType(const std::vector<Span>& spans, std::string_view type) {
    auto it = std::find_if(spans.begin(), spans.end(),
                           [type](const Span& span) { return span.type == type; });
    return it == spans.end() ? nullptr : &*it;
}

}  // namespace

// =============================================================================
// Checksums
// =============================================================================

TEST(ChecksumTest, Iban) {
    EXPECT_TRUE(isValidIban("DE89 3704 0044 0532 0130 00"));
    EXPECT_TRUE(isValidIban("GB82WEST12345698765432"));
    EXPECT_TRUE(isValidIban("gb82 west 1234 5698 7654 32"));
    EXPECT_FALSE(isValidIban("GB82WEST12345698765433"));
    EXPECT_FALSE(isValidIban("DE89"));
    EXPECT_FALSE(isValidIban("DE89-3704-0044-0532-0130-00"));
}

TEST(ChecksumTest, Luhn) {
    EXPECT_TRUE(passesLuhn("4111 1111 1111 1111"));
    EXPECT_TRUE(passesLuhn("5500-0000-0000-0004"));
    EXPECT_FALSE(passesLuhn("4111 1111 1111 1112"));
    EXPECT_FALSE(passesLuhn("4111"));
}

TEST(ChecksumTest, MaskedValues) {
    EXPECT_TRUE(looksMasked("XXXX-1234"));
    EXPECT_TRUE(looksMasked("jo***@example.com"));
    EXPECT_FALSE(looksMasked("4111 1111 1111 1111"));
}

// =============================================================================
// Detection
// =============================================================================

TEST(PatternDetectorTest, ScanRequiresPrepare) {
    PatternDetector detector;
    EXPECT_FALSE(detector.prepared());
    EXPECT_THROW((void)detector.scan("text"), DetectorUnavailableError);

    detector.prepare();
    EXPECT_TRUE(detector.prepared());
    detector.release();
    EXPECT_FALSE(detector.prepared());
}

TEST(PatternDetectorTest, Email) {
    const auto spans = detect("Contact alice@example.com today.");
    const auto* email = findType(spans, "EMAIL");
    ASSERT_NE(email, nullptr);
    EXPECT_EQ(email->start, 8U);
    EXPECT_EQ(email->surface, "alice@example.com");
}

TEST(PatternDetectorTest, ValidIbanOnly) {
    const auto valid = detect("Pay to DE89 3704 0044 0532 0130 00 please");
    const auto* iban = findType(valid, "IBAN");
    ASSERT_NE(iban, nullptr);
    EXPECT_EQ(iban->surface, "DE89 3704 0044 0532 0130 00");

    const auto invalid = detect("Pay to DE00 3704 0044 0532 0130 00 please");
    EXPECT_EQ(findType(invalid, "IBAN"), nullptr);
}

TEST(PatternDetectorTest, CreditCardNeedsLuhn) {
    const auto valid = detect("card 4111 1111 1111 1111 exp");
    const auto* card = findType(valid, "CREDIT_CARD");
    ASSERT_NE(card, nullptr);
    EXPECT_EQ(card->surface, "4111 1111 1111 1111");

    EXPECT_EQ(findType(detect("card 4111 1111 1111 1112 exp"), "CREDIT_CARD"), nullptr);
}

TEST(PatternDetectorTest, SsnOutranksPhone) {
    const auto spans = detect("SSN 123-45-6789.");
    ASSERT_EQ(spans.size(), 1U);
    EXPECT_EQ(spans[0].type, "ID");
    EXPECT_EQ(spans[0].surface, "123-45-6789");
}

TEST(PatternDetectorTest, DateNeedsBirthCue) {
    const auto born = detect("She was born 12.03.1985 in Berlin.");
    const auto* dob = findType(born, "DOB");
    ASSERT_NE(dob, nullptr);
    EXPECT_EQ(dob->surface, "12.03.1985");

    const auto meeting = detect("The meeting on 12.03.1985 was short.");
    EXPECT_TRUE(meeting.empty());

    const auto anyDate = detect("The meeting on 12.03.1985 was short.",
                                PatternOptions{.requireDateContext = false});
    EXPECT_NE(findType(anyDate, "DOB"), nullptr);
}

TEST(PatternDetectorTest, PhoneWithCountryCode) {
    const auto spans = detect("call +1 555-123-4567 now");
    const auto* phone = findType(spans, "PHONE");
    ASSERT_NE(phone, nullptr);
    EXPECT_EQ(phone->surface, "+1 555-123-4567");
}

TEST(PatternDetectorTest, ShortNumbersAreNotPhones) {
    EXPECT_TRUE(detect("Room 12-34 on floor 3").empty());
}

TEST(PatternDetectorTest, UrlDropsSentencePunctuation) {
    const auto spans = detect("See https://example.com/a?b=1.");
    const auto* url = findType(spans, "URL");
    ASSERT_NE(url, nullptr);
    EXPECT_EQ(url->surface, "https://example.com/a?b=1");
}

TEST(PatternDetectorTest, SkipMaskedValues) {
    const std::string text = "Profile at https://example.com/XX/profile";
    EXPECT_NE(findType(detect(text), "URL"), nullptr);
    EXPECT_EQ(findType(detect(text, PatternOptions{.skipMasked = true}), "URL"), nullptr);
}

TEST(PatternDetectorTest, PlainProseHasNoFindings) {
    EXPECT_TRUE(detect("The quarterly report was reviewed by the staff on Monday.").empty());
}

}  // namespace docsan::detect::test
