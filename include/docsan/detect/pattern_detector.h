// =============================================================================
// docsan - Pattern Detector
// =============================================================================
// Regular-expression detector for identifiers with a recognizable shape:
//   EMAIL        local@domain.tld
//   IBAN         country code + check digits + BBAN, mod-97 validated
//   CREDIT_CARD  13-19 digits, Luhn validated
//   PHONE        7-15 digits with common separators
//   ID           US SSN shape (ddd-dd-dddd)
//   DOB          dates preceded by a birth-date cue ("born", "DOB", ...)
//   URL          http(s) URLs
//
// Regexes are compiled in prepare() and shared read-only by scan().
// =============================================================================

#ifndef DOCSAN_DETECT_PATTERN_DETECTOR_H
#define DOCSAN_DETECT_PATTERN_DETECTOR_H

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "docsan/detect/detector.h"

namespace docsan::detect {

/// @brief Options for PatternDetector.
struct PatternOptions {
    /// @brief Skip values that are already masked ("XX", "***").
    bool skipMasked = false;

    /// @brief Detect dates only when a birth-date cue precedes them.
    bool requireDateContext = true;

    /// @brief Bytes before a date searched for a birth-date cue.
    std::size_t dateContextWindow = 40;
};

/// @brief Check an IBAN's ISO 13616 mod-97 checksum (spaces ignored).
[[nodiscard]] bool isValidIban(std::string_view iban) noexcept;

/// @brief Check a card number's Luhn checksum (non-digits ignored).
[[nodiscard]] bool passesLuhn(std::string_view number) noexcept;

/// @brief Check whether a value looks already masked.
[[nodiscard]] bool looksMasked(std::string_view value) noexcept;

class PatternDetector final : public Detector {
public:
    explicit PatternDetector(PatternOptions options = {});
    ~PatternDetector() override;

    [[nodiscard]] std::string_view name() const noexcept override { return "pattern"; }

    void prepare() override;

    void release() noexcept override;

    [[nodiscard]] std::vector<Span> scan(std::string_view text) const override;

    [[nodiscard]] bool prepared() const noexcept { return patterns_ != nullptr; }

private:
    struct Patterns;

    PatternOptions options_;
    std::unique_ptr<Patterns> patterns_;
};

}  // namespace docsan::detect

#endif  // DOCSAN_DETECT_PATTERN_DETECTOR_H
