// =============================================================================
// docsan - Detector Interface
// =============================================================================
// A Detector finds type-tagged spans of sensitive text. The engine depends
// only on this interface; pattern matching, term lists and external
// model-based recognizers plug in uniformly.
//
// Lifecycle:
//   prepare()  load or compile expensive state (once per batch)
//   scan()     const and thread-safe after prepare()
//   release()  drop the state again
//
// DetectorScope ties prepare()/release() to a scope.
// =============================================================================

#ifndef DOCSAN_DETECT_DETECTOR_H
#define DOCSAN_DETECT_DETECTOR_H

#include <memory>
#include <string_view>
#include <vector>

#include "docsan/common/types.h"

namespace docsan::detect {

/// @brief Abstract entity detector.
class Detector {
public:
    virtual ~Detector() = default;

    /// @brief Short registry name ("pattern", "dictionary", ...).
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// @brief Acquire expensive state.
    /// @throws DetectorUnavailableError if the detector cannot run.
    virtual void prepare() {}

    /// @brief Release state acquired by prepare().
    virtual void release() noexcept {}

    /// @brief Find candidate spans in @p text.
    /// @throws DetectorUnavailableError if called without a successful prepare().
    [[nodiscard]] virtual std::vector<Span> scan(std::string_view text) const = 0;

protected:
    Detector() = default;
    Detector(const Detector&) = default;
    Detector& operator=(const Detector&) = default;
};

/// @brief RAII: prepare() on construction, release() on destruction.
class DetectorScope {
public:
    explicit DetectorScope(Detector& detector) : detector_(detector) { detector_.prepare(); }

    ~DetectorScope() { detector_.release(); }

    DetectorScope(const DetectorScope&) = delete;
    DetectorScope& operator=(const DetectorScope&) = delete;

    [[nodiscard]] const Detector& detector() const noexcept { return detector_; }

private:
    Detector& detector_;
};

/// @brief Runs several detectors and concatenates their spans.
/// @note A child that fails to prepare is logged and skipped, so the engine
///       keeps working with reduced coverage.
class CompositeDetector final : public Detector {
public:
    CompositeDetector() = default;

    void add(std::unique_ptr<Detector> detector);

    [[nodiscard]] std::string_view name() const noexcept override { return "composite"; }

    void prepare() override;

    void release() noexcept override;

    [[nodiscard]] std::vector<Span> scan(std::string_view text) const override;

    /// @brief Number of children.
    [[nodiscard]] std::size_t size() const noexcept { return children_.size(); }

    /// @brief Number of children that prepared successfully.
    [[nodiscard]] std::size_t activeCount() const noexcept;

private:
    struct Child {
        std::unique_ptr<Detector> detector;
        bool active = false;
    };

    std::vector<Child> children_;
};

}  // namespace docsan::detect

#endif  // DOCSAN_DETECT_DETECTOR_H
