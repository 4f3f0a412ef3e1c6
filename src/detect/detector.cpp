// =============================================================================
// docsan - Composite Detector Implementation
// =============================================================================

#include "docsan/detect/detector.h"

#include <algorithm>
#include <iterator>

#include "docsan/common/error.h"
#include "docsan/common/logger.h"

namespace docsan::detect {

void CompositeDetector::add(std::unique_ptr<Detector> detector) {
    if (detector != nullptr) {
        children_.push_back({std::move(detector), false});
    }
}

void CompositeDetector::prepare() {
    for (auto& child : children_) {
        try {
            child.detector->prepare();
            child.active = true;
        } catch (const DetectorUnavailableError& ex) {
            child.active = false;
            DOCSAN_LOG_WARNING("Detector '{}' unavailable, continuing without it: {}",
                               child.detector->name(), ex.message());
        }
    }
}

void CompositeDetector::release() noexcept {
    for (auto& child : children_) {
        if (child.active) {
            child.detector->release();
            child.active = false;
        }
    }
}

std::vector<Span> CompositeDetector::scan(std::string_view text) const {
    std::vector<Span> spans;
    for (const auto& child : children_) {
        if (!child.active) {
            continue;
        }
        auto found = child.detector->scan(text);
        DOCSAN_LOG_DEBUG("Detector '{}' reported {} spans", child.detector->name(), found.size());
        spans.insert(spans.end(), std::make_move_iterator(found.begin()),
                     std::make_move_iterator(found.end()));
    }
    return spans;
}

std::size_t CompositeDetector::activeCount() const noexcept {
    return static_cast<std::size_t>(std::count_if(
        children_.begin(), children_.end(), [](const Child& child) { return child.active; }));
}

}  // namespace docsan::detect
