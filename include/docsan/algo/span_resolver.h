// =============================================================================
// docsan - Span Resolver
// =============================================================================
// Turns one or more detector span lists (possibly overlapping or nested) into
// a non-overlapping, left-to-right ordered span set.
//
// Algorithm:
//   1. Drop malformed candidates (empty or inverted range, range past the end
//      of the source, invalid type tag, whitespace-only text).
//   2. Re-read each candidate's surface text from the source.
//   3. Sort by (start, -length).
//   4. Walk left to right. A candidate overlapping the last accepted span
//      replaces it only if it wins on priority, then length, then confidence.
//
// Rejected spans are dropped, never merged. The result is deterministic for a
// fixed candidate set and priority table.
// =============================================================================

#ifndef DOCSAN_ALGO_SPAN_RESOLVER_H
#define DOCSAN_ALGO_SPAN_RESOLVER_H

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

#include "docsan/algo/entity_type.h"
#include "docsan/common/types.h"

namespace docsan::algo {

/// @brief Counters collected by one resolve() call.
struct ResolveStats {
    std::size_t candidates = 0;
    std::size_t malformed = 0;
    std::size_t rejected = 0;
    std::size_t accepted = 0;
};

/// @brief Disambiguates overlapping candidate spans.
class SpanResolver {
public:
    explicit SpanResolver(PriorityTable priorities = {}) : priorities_(std::move(priorities)) {}

    /// @brief Resolve a single candidate list.
    /// @param source Text the candidates refer to.
    /// @param candidates Candidate spans in any order.
    /// @param stats Optional counters.
    /// @return Non-overlapping spans ordered by start offset.
    [[nodiscard]] std::vector<Span> resolve(std::string_view source, std::vector<Span> candidates,
                                            ResolveStats* stats = nullptr) const;

    /// @brief Resolve several candidate lists (e.g. one per detector) together.
    [[nodiscard]] std::vector<Span> resolve(std::string_view source,
                                            std::span<const std::vector<Span>> lists,
                                            ResolveStats* stats = nullptr) const;

    /// @brief Check whether @p candidate beats @p accepted on overlap.
    [[nodiscard]] bool wins(const Span& candidate, const Span& accepted) const;

    [[nodiscard]] const PriorityTable& priorities() const noexcept { return priorities_; }

private:
    PriorityTable priorities_;
};

/// @brief Check that spans are sorted and pairwise non-overlapping.
[[nodiscard]] bool isOrderedNonOverlapping(std::span<const Span> spans) noexcept;

}  // namespace docsan::algo

#endif  // DOCSAN_ALGO_SPAN_RESOLVER_H
