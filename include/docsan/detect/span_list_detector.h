// =============================================================================
// docsan - Span List Detector
// =============================================================================
// Replays spans produced by an external detector (an NER model, a reviewer's
// annotations, ...). The list is bound to one document by byte offsets.
//
// Span file format, one span per line:
//   start<TAB>end<TAB>TYPE[<TAB>confidence]
// Blank lines and lines starting with '#' are ignored.
// =============================================================================

#ifndef DOCSAN_DETECT_SPAN_LIST_DETECTOR_H
#define DOCSAN_DETECT_SPAN_LIST_DETECTOR_H

#include <filesystem>
#include <string_view>
#include <vector>

#include "docsan/detect/detector.h"

namespace docsan::detect {

/// @brief Parse a span list.
/// @param origin Name used in error messages.
/// @throws DetectorUnavailableError on a malformed line.
[[nodiscard]] std::vector<Span> parseSpanList(std::string_view content,
                                              std::string_view origin = {});

class SpanListDetector final : public Detector {
public:
    explicit SpanListDetector(std::vector<Span> spans);
    explicit SpanListDetector(std::filesystem::path path);

    [[nodiscard]] std::string_view name() const noexcept override { return "spans"; }

    void prepare() override;

    void release() noexcept override;

    /// @brief Return the loaded spans with their surface taken from @p text.
    /// @note Out-of-range spans are passed through; the resolver rejects them.
    [[nodiscard]] std::vector<Span> scan(std::string_view text) const override;

private:
    std::filesystem::path path_;
    std::vector<Span> spans_;
    bool ready_ = false;
};

}  // namespace docsan::detect

#endif  // DOCSAN_DETECT_SPAN_LIST_DETECTOR_H
