// =============================================================================
// docsan - Detector Registry
// =============================================================================
// Builds detectors by name for the command line ("pattern", "dictionary",
// "spans").
// =============================================================================

#ifndef DOCSAN_DETECT_DETECTOR_REGISTRY_H
#define DOCSAN_DETECT_DETECTOR_REGISTRY_H

#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "docsan/common/error.h"
#include "docsan/detect/detector.h"
#include "docsan/detect/pattern_detector.h"

namespace docsan::detect {

/// @brief Inputs that detectors may need.
struct DetectorOptions {
    std::filesystem::path dictionaryPath;
    std::filesystem::path spansPath;
    PatternOptions pattern;
};

/// @brief Names accepted by createDetector().
[[nodiscard]] std::span<const std::string_view> availableDetectors() noexcept;

/// @brief Create a detector by name.
/// @return kDetectorUnavailable for an unknown name or a missing input path.
[[nodiscard]] Result<std::unique_ptr<Detector>> createDetector(std::string_view name,
                                                               const DetectorOptions& options);

/// @brief Create a CompositeDetector from several names.
/// @note An empty list selects the pattern detector, plus the dictionary and
///       span list detectors when their paths are set. "none" selects nothing.
///       Unknown or unusable names are logged and skipped.
[[nodiscard]] std::unique_ptr<CompositeDetector> createDetectors(
    const std::vector<std::string>& names, const DetectorOptions& options);

}  // namespace docsan::detect

#endif  // DOCSAN_DETECT_DETECTOR_REGISTRY_H
