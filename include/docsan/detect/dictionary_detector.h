// =============================================================================
// docsan - Dictionary Detector
// =============================================================================
// Finds user-supplied terms (names, organizations, project code names, ...).
//
// Dictionary file format (UTF-8), one term per line:
//   TYPE<TAB>term
// Blank lines and lines starting with '#' are ignored. Matching is ASCII
// case-insensitive and restricted to word boundaries.
// =============================================================================

#ifndef DOCSAN_DETECT_DICTIONARY_DETECTOR_H
#define DOCSAN_DETECT_DICTIONARY_DETECTOR_H

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "docsan/detect/detector.h"

namespace docsan::detect {

/// @brief One dictionary term.
struct DictionaryTerm {
    std::string type;
    std::string term;

    bool operator==(const DictionaryTerm& other) const = default;
};

/// @brief Parse dictionary text.
/// @param origin Name used in error messages.
/// @throws DetectorUnavailableError on a malformed line.
[[nodiscard]] std::vector<DictionaryTerm> parseDictionary(std::string_view content,
                                                          std::string_view origin = {});

class DictionaryDetector final : public Detector {
public:
    /// @brief Detector over an in-memory term list (ready without a file).
    explicit DictionaryDetector(std::vector<DictionaryTerm> terms);

    /// @brief Detector that loads @p path in prepare().
    explicit DictionaryDetector(std::filesystem::path path);

    [[nodiscard]] std::string_view name() const noexcept override { return "dictionary"; }

    /// @throws DetectorUnavailableError if the dictionary cannot be read.
    void prepare() override;

    void release() noexcept override;

    [[nodiscard]] std::vector<Span> scan(std::string_view text) const override;

    [[nodiscard]] std::size_t termCount() const noexcept { return terms_.size(); }

private:
    void sortTerms();

    std::filesystem::path path_;
    std::vector<DictionaryTerm> terms_;
    bool ready_ = false;
};

}  // namespace docsan::detect

#endif  // DOCSAN_DETECT_DICTIONARY_DETECTOR_H
