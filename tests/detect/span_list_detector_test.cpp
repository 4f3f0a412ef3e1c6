// =============================================================================
// docsan - Span List Detector Tests
// =============================================================================

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "docsan/common/error.h"
#include "docsan/detect/span_list_detector.h"

namespace docsan::detect::test {

TEST(SpanListParseTest, ParsesFieldsAndDefaults) {
    const auto spans = parseSpanList("0\t4\tperson\n# reviewer notes\n\n5\t9\tORG\t0.5\r\n");
    ASSERT_EQ(spans.size(), 2U);
    EXPECT_EQ(spans[0].start, 0U);
    EXPECT_EQ(spans[0].end, 4U);
    EXPECT_EQ(spans[0].type, "PERSON");
    EXPECT_DOUBLE_EQ(spans[0].confidence, 1.0);
    EXPECT_EQ(spans[1].type, "ORG");
    EXPECT_DOUBLE_EQ(spans[1].confidence, 0.5);
}

TEST(SpanListParseTest, RejectsMalformedLines) {
    EXPECT_THROW((void)parseSpanList("0\t4\n"), DetectorUnavailableError);
    EXPECT_THROW((void)parseSpanList("0\t4\tPERSON\t1\textra\n"), DetectorUnavailableError);
    EXPECT_THROW((void)parseSpanList("a\t4\tPERSON\n"), DetectorUnavailableError);
    EXPECT_THROW((void)parseSpanList("-1\t4\tPERSON\n"), DetectorUnavailableError);
    EXPECT_THROW((void)parseSpanList("0\t4\t1BAD\n"), DetectorUnavailableError);
    EXPECT_THROW((void)parseSpanList("0\t4\tPERSON\thigh\n"), DetectorUnavailableError);
}

TEST(SpanListParseTest, ErrorNamesOriginAndLine) {
    try {
        (void)parseSpanList("0\t4\tPERSON\n\nbroken\n", "doc.spans");
        FAIL() << "expected DetectorUnavailableError";
    } catch (const DetectorUnavailableError& ex) {
        EXPECT_NE(ex.message().find("doc.spans:3"), std::string::npos);
    }
}

TEST(SpanListDetectorTest, ScanFillsSurfaceFromText) {
    SpanListDetector detector(std::vector<Span>{
        Span{.start = 0, .end = 4, .type = "PERSON"},
        Span{.start = 20, .end = 30, .type = "ORG"},
    });

    const auto spans = detector.scan("Jane works at home");
    ASSERT_EQ(spans.size(), 2U);
    EXPECT_EQ(spans[0].surface, "Jane");
    // Out of range: passed through for the resolver to drop
    EXPECT_TRUE(spans[1].surface.empty());
}

TEST(SpanListDetectorTest, MissingFileIsUnavailable) {
    SpanListDetector detector(std::filesystem::path("/nonexistent/docsan/spans.tsv"));
    EXPECT_THROW(detector.prepare(), DetectorUnavailableError);
}

}  // namespace docsan::detect::test
