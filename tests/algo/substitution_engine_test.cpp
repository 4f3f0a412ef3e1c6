// =============================================================================
// docsan - Substitution Engine Tests
// =============================================================================
// Forward rewrite, variant sweep, leak check and the tolerant reverse pass.
// =============================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "docsan/algo/entity_normalizer.h"
#include "docsan/algo/placeholder.h"
#include "docsan/algo/substitution_engine.h"

namespace docsan::algo::test {

namespace {

#define OPEN "\xE2\x9F\xA6"
#define CLOSE "\xE2\x9F\xA7"

const std::string kSource = "John Smith lives at 221B Baker Street, phone 555-1234.";

std::vector<Span> scenarioSpans() {
    return {
        Span{.start = 0, .end = 10, .type = "PERSON", .surface = "John Smith"},
        Span{.start = 20, .end = 37, .type = "STREET", .surface = "221B Baker Street"},
        Span{.start = 45, .end = 53, .type = "PHONE", .surface = "555-1234"},
    };
}

PlaceholderTable scenarioTable() {
    PlaceholderTable table;
    table.add("PERSON_1", "PERSON", "John Smith");
    table.add("STREET_1", "STREET", "221B Baker Street");
    table.add("PHONE_1", "PHONE", "555-1234");
    return table;
}

}  // namespace

// =============================================================================
// Forward Pass
// =============================================================================

TEST(SubstitutionEngineTest, RewriteScenario) {
    const auto spans = scenarioSpans();
    const auto normalized = EntityNormalizer{}.normalize(spans);
    PlaceholderAllocator allocator;
    const auto placeholders = allocator.allocate(normalized.entities);

    SubstitutionEngine engine;
    const auto sanitized = engine.rewrite(kSource, normalized.occurrences, placeholders);
    EXPECT_EQ(sanitized, OPEN "PERSON_1" CLOSE " lives at " OPEN "STREET_1" CLOSE ", phone " OPEN
                         "PHONE_1" CLOSE ".");
    EXPECT_NO_THROW(engine.checkLeaks(sanitized, normalized.entities, 3));

    const auto restored = engine.restore(sanitized, scenarioTable());
    EXPECT_EQ(restored.restored, kSource);
    EXPECT_EQ(restored.resolved, 3U);
    EXPECT_TRUE(restored.unresolved.empty());
}

TEST(SubstitutionEngineTest, RewriteRejectsOutOfOrderOccurrences) {
    const auto spans = scenarioSpans();
    auto normalized = EntityNormalizer{}.normalize(spans);
    std::swap(normalized.occurrences[0], normalized.occurrences[1]);
    PlaceholderAllocator allocator;
    const auto placeholders = allocator.allocate(normalized.entities);

    try {
        (void)SubstitutionEngine{}.rewrite(kSource, normalized.occurrences, placeholders);
        FAIL() << "expected an invalid-state error";
    } catch (const DocsanException& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::kInvalidState);
    }
}

TEST(SubstitutionEngineTest, SweepFindsUndetectedOccurrences) {
    const std::string source = "Alice Walker met alice walker and Alice Walkerson";
    std::vector<Span> resolved = {
        Span{.start = 0, .end = 12, .type = "PERSON", .surface = "Alice Walker"}};
    const auto normalized = EntityNormalizer{}.normalize(resolved);

    SubstitutionEngine engine;
    const auto swept = engine.sweepVariants(source, resolved, normalized.entities, 3);
    ASSERT_EQ(swept.size(), 2U);
    EXPECT_EQ(swept[0].start, 17U);
    EXPECT_EQ(swept[0].surface, "alice walker");
    EXPECT_EQ(swept[0].type, "PERSON");
    EXPECT_EQ(swept[1].start, 34U);
    EXPECT_EQ(swept[1].surface, "Alice Walker");
}

TEST(SubstitutionEngineTest, SweepReplacesValuesInsideLongerTokens) {
    const std::string source = "Call 555-1234 or 555-12345, mail alice@x.com, cc malice@x.com.";
    std::vector<Span> resolved = {
        Span{.start = 5, .end = 13, .type = "PHONE", .surface = "555-1234"},
        Span{.start = 33, .end = 44, .type = "EMAIL", .surface = "alice@x.com"},
    };
    const auto normalized = EntityNormalizer{}.normalize(resolved);

    SubstitutionEngine engine;
    const auto swept = engine.sweepVariants(source, resolved, normalized.entities, 4);
    ASSERT_EQ(swept.size(), 2U);
    EXPECT_EQ(swept[0].start, 17U);
    EXPECT_EQ(swept[0].type, "PHONE");
    EXPECT_EQ(swept[1].start, 50U);
    EXPECT_EQ(swept[1].type, "EMAIL");

    std::vector<Span> all = resolved;
    all.insert(all.end(), swept.begin(), swept.end());
    std::sort(all.begin(), all.end(),
              [](const Span& a, const Span& b) { return a.start < b.start; });
    const auto grouped = EntityNormalizer{}.normalize(all);
    const auto placeholders = PlaceholderAllocator{}.allocate(grouped.entities);
    const auto sanitized = engine.rewrite(source, grouped.occurrences, placeholders);

    EXPECT_EQ(sanitized, "Call " OPEN "PHONE_1" CLOSE " or " OPEN "PHONE_1" CLOSE
                         "5, mail " OPEN "EMAIL_1" CLOSE ", cc m" OPEN "EMAIL_1" CLOSE ".");
    EXPECT_FALSE(engine.findLeak(sanitized, grouped.entities, 4).has_value());
}

TEST(SubstitutionEngineTest, SweepHonorsMinimumLength) {
    const std::string source = "Al and al";
    std::vector<Span> resolved = {Span{.start = 0, .end = 2, .type = "PERSON", .surface = "Al"}};
    const auto normalized = EntityNormalizer{}.normalize(resolved);

    SubstitutionEngine engine;
    EXPECT_TRUE(engine.sweepVariants(source, resolved, normalized.entities, 3).empty());
    EXPECT_EQ(engine.sweepVariants(source, resolved, normalized.entities, 2).size(), 1U);
}

TEST(SubstitutionEngineTest, MaskHidesPlaceholders) {
    SubstitutionEngine engine;
    const std::string sanitized = "a " OPEN "X_1" CLOSE " b";
    const auto masked = engine.maskPlaceholders(sanitized);
    ASSERT_EQ(masked.size(), sanitized.size());
    EXPECT_EQ(masked.find("X_1"), std::string::npos);
    EXPECT_EQ(masked.substr(0, 2), "a ");
    EXPECT_EQ(masked.substr(masked.size() - 2), " b");
}

TEST(SubstitutionEngineTest, LeakCheckReportsRemainingValue) {
    Entity entity;
    entity.type = "PERSON";
    entity.canonical = "Alice Walker";
    entity.variants = {"Alice Walker"};
    const std::vector<Entity> entities = {entity};

    SubstitutionEngine engine;
    const std::string sanitized = OPEN "PERSON_1" CLOSE " and Alice Walker";

    auto leak = engine.findLeak(sanitized, entities, 3);
    ASSERT_TRUE(leak.has_value());
    EXPECT_EQ(leak->entityIndex, 0U);
    EXPECT_EQ(leak->offset, 19U);

    EXPECT_THROW(engine.checkLeaks(sanitized, entities, 3), LeakDetectedError);
    EXPECT_FALSE(engine.findLeak(sanitized, entities, 20).has_value());
}

TEST(SubstitutionEngineTest, LeakCheckFindsValueInsideLongerToken) {
    Entity entity;
    entity.type = "IBAN";
    entity.canonical = "NL91ABNA0417164300";
    entity.variants = {"NL91ABNA0417164300"};
    const std::vector<Entity> entities = {entity};

    SubstitutionEngine engine;
    const std::string sanitized = "ref " OPEN "IBAN_1" CLOSE " and nl91abna04171643001";

    auto leak = engine.findLeak(sanitized, entities, 4);
    ASSERT_TRUE(leak.has_value());
    EXPECT_EQ(leak->offset, sanitized.size() - 19);
    EXPECT_THROW(engine.checkLeaks(sanitized, entities, 4), LeakDetectedError);
}

// =============================================================================
// Reverse Pass
// =============================================================================

TEST(SubstitutionEngineTest, RestoreLeavesUnknownPlaceholders) {
    SubstitutionEngine engine;
    const std::string text = OPEN "PERSON_1" CLOSE " met " OPEN "PERSON_9" CLOSE " at " OPEN
                                  "STREET_1" CLOSE ".";

    const auto result = engine.restore(text, scenarioTable());
    EXPECT_EQ(result.restored, "John Smith met " OPEN "PERSON_9" CLOSE " at 221B Baker Street.");
    EXPECT_EQ(result.resolved, 2U);
    ASSERT_EQ(result.unresolved.size(), 1U);
    EXPECT_EQ(result.unresolved[0].token, "PERSON_9");
    EXPECT_EQ(result.unresolved[0].raw, OPEN "PERSON_9" CLOSE);
    EXPECT_EQ(result.unresolved[0].offset, 19U);
}

TEST(SubstitutionEngineTest, RestoreCopiesDelimitedTextThatIsNotAPlaceholder) {
    SubstitutionEngine engine;
    const std::string text = "See " OPEN "note" CLOSE " and " OPEN "PERSON_1" CLOSE " today.";

    const auto result = engine.restore(text, scenarioTable());
    EXPECT_EQ(result.restored, "See " OPEN "note" CLOSE " and John Smith today.");
    EXPECT_EQ(result.resolved, 1U);
    EXPECT_TRUE(result.unresolved.empty());
}

TEST(SubstitutionEngineTest, RestoreRepeatedPlaceholder) {
    SubstitutionEngine engine;
    const auto result =
        engine.restore(OPEN "PERSON_1" CLOSE " and " OPEN "PERSON_1" CLOSE, scenarioTable());
    EXPECT_EQ(result.restored, "John Smith and John Smith");
    EXPECT_EQ(result.resolved, 2U);
}

TEST(SubstitutionEngineTest, RestoreToleratesDecoration) {
    SubstitutionEngine engine;
    const auto table = scenarioTable();

    EXPECT_EQ(engine.restore(OPEN " PERSON_1 " CLOSE, table).restored, "John Smith");
    EXPECT_EQ(engine.restore(OPEN "**PERSON_1**" CLOSE, table).restored, "John Smith");
    EXPECT_EQ(engine.restore(OPEN "`phone_1`" CLOSE, table).restored, "555-1234");
}

TEST(SubstitutionEngineTest, RestoreRejectsExcessDecoration) {
    SubstitutionEngine engine;
    const std::string text = OPEN "    PERSON_1" CLOSE;

    const auto result = engine.restore(text, scenarioTable());
    EXPECT_EQ(result.restored, text);
    EXPECT_EQ(result.resolved, 0U);
    EXPECT_TRUE(result.unresolved.empty());
}

TEST(SubstitutionEngineTest, StrictPolicyDisablesTolerance) {
    SubstitutionEngine engine;
    const auto strict = TolerancePolicy::strict();
    const auto table = scenarioTable();

    const std::string spaced = OPEN " PERSON_1 " CLOSE;
    EXPECT_EQ(engine.restore(spaced, table, strict).restored, spaced);

    const auto lower = engine.restore(OPEN "person_1" CLOSE, table, strict);
    EXPECT_EQ(lower.restored, OPEN "person_1" CLOSE);
    EXPECT_EQ(lower.resolved, 0U);
    EXPECT_TRUE(lower.unresolved.empty());
}

TEST(SubstitutionEngineTest, ZeroPaddedIndexIsOptIn) {
    SubstitutionEngine engine;
    const auto table = scenarioTable();
    const std::string text = OPEN "PERSON_01" CLOSE;

    const auto plain = engine.restore(text, table);
    EXPECT_EQ(plain.restored, text);
    EXPECT_TRUE(plain.unresolved.empty());

    TolerancePolicy padded;
    padded.acceptZeroPaddedIndex = true;
    EXPECT_EQ(engine.restore(text, table, padded).restored, "John Smith");
}

TEST(SubstitutionEngineTest, BareTokensOnlyWhenEnabled) {
    SubstitutionEngine engine;
    const auto table = scenarioTable();
    const std::string text = "PERSON_1 called ORG_1 and PERSON_7";

    const auto off = engine.restore(text, table);
    EXPECT_EQ(off.restored, text);
    EXPECT_EQ(off.resolved, 0U);

    TolerancePolicy bare;
    bare.matchBareTokens = true;
    const auto on = engine.restore(text, table, bare);
    EXPECT_EQ(on.restored, "John Smith called ORG_1 and PERSON_7");
    EXPECT_EQ(on.resolved, 1U);
    ASSERT_EQ(on.unresolved.size(), 1U);
    EXPECT_EQ(on.unresolved[0].token, "PERSON_7");
}

TEST(SubstitutionEngineTest, UnterminatedPlaceholderIsCopied) {
    SubstitutionEngine engine;
    const std::string text = "see " OPEN "PERSON_1 and more";

    const auto result = engine.restore(text, scenarioTable());
    EXPECT_EQ(result.restored, text);
    EXPECT_TRUE(result.unresolved.empty());
}

TEST(SubstitutionEngineTest, CustomDelimiters) {
    SubstitutionEngine engine(Delimiters{"[[", "]]"});
    const auto result = engine.restore("hi [[PERSON_1]]!", scenarioTable());
    EXPECT_EQ(result.restored, "hi John Smith!");
}

#undef OPEN
#undef CLOSE

}  // namespace docsan::algo::test
