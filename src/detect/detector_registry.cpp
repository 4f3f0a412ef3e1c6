// =============================================================================
// docsan - Detector Registry Implementation
// =============================================================================

#include "docsan/detect/detector_registry.h"

#include <array>
#include <format>

#include "docsan/common/logger.h"
#include "docsan/detect/dictionary_detector.h"
#include "docsan/detect/span_list_detector.h"

namespace docsan::detect {

namespace {

constexpr std::array<std::string_view, 3> kDetectorNames = {"pattern", "dictionary", "spans"};

constexpr std::string_view kNoDetector = "none";

}  // namespace

std::span<const std::string_view> availableDetectors() noexcept {
    return kDetectorNames;
}

Result<std::unique_ptr<Detector>> createDetector(std::string_view name,
                                                 const DetectorOptions& options) {
    if (name == "pattern") {
        return std::make_unique<PatternDetector>(options.pattern);
    }
    if (name == "dictionary") {
        if (options.dictionaryPath.empty()) {
            return makeError<std::unique_ptr<Detector>>(
                ErrorCode::kDetectorUnavailable,
                "dictionary detector requires a dictionary file (--dictionary)");
        }
        return std::make_unique<DictionaryDetector>(options.dictionaryPath);
    }
    if (name == "spans") {
        if (options.spansPath.empty()) {
            return makeError<std::unique_ptr<Detector>>(
                ErrorCode::kDetectorUnavailable,
                "span list detector requires a span file (--spans)");
        }
        return std::make_unique<SpanListDetector>(options.spansPath);
    }
    return makeError<std::unique_ptr<Detector>>(ErrorCode::kDetectorUnavailable,
                                                std::format("unknown detector '{}'", name));
}

std::unique_ptr<CompositeDetector> createDetectors(const std::vector<std::string>& names,
                                                   const DetectorOptions& options) {
    std::vector<std::string> selected = names;
    if (selected.empty()) {
        selected.emplace_back("pattern");
        if (!options.dictionaryPath.empty()) {
            selected.emplace_back("dictionary");
        }
        if (!options.spansPath.empty()) {
            selected.emplace_back("spans");
        }
    }

    auto composite = std::make_unique<CompositeDetector>();
    for (const auto& name : selected) {
        if (name == kNoDetector) {
            continue;
        }
        auto detector = createDetector(name, options);
        if (!detector) {
            DOCSAN_LOG_WARNING("Skipping detector: {}", detector.error().message());
            continue;
        }
        composite->add(std::move(*detector));
    }
    if (composite->size() == 0) {
        DOCSAN_LOG_WARNING("No detectors selected; documents will pass through unchanged");
    }
    return composite;
}

}  // namespace docsan::detect
