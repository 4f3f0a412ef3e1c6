// =============================================================================
// docsan - Legend Generator Implementation
// =============================================================================

#include "docsan/algo/legend_generator.h"

#include <iterator>

#include <fmt/format.h>

#include "docsan/algo/entity_type.h"

namespace docsan::algo {

namespace {

/// @brief Separator placed between sanitized text and the legend block.
constexpr std::string_view kLegendSeparator = "\n\n";

}  // namespace

TypeCounts LegendGenerator::countByType(std::span<const Entity> entities) {
    TypeCounts counts;
    for (const auto& entity : entities) {
        ++counts[entity.type];
    }
    return counts;
}

std::string LegendGenerator::summary(const TypeCounts& counts) {
    std::string line;
    for (const auto& [type, count] : counts) {
        if (!line.empty()) {
            line += ", ";
        }
        fmt::format_to(std::back_inserter(line), "{} {}", count, typeNoun(type, count));
    }
    return line;
}

std::string LegendGenerator::render(const TypeCounts& counts) {
    if (counts.empty()) {
        return {};
    }

    fmt::memory_buffer buffer;
    auto out = std::back_inserter(buffer);
    fmt::format_to(out, "{}\n", kLegendBeginMarker);
    fmt::format_to(out,
                   "Sensitive values in this document were replaced by placeholders of the form "
                   "TYPE_n.\n"
                   "The same value always uses the same placeholder. Keep placeholders unchanged "
                   "in your answer.\n");
    for (const auto& [type, count] : counts) {
        fmt::format_to(out, "  {:<14} {} {}\n", type, count, typeNoun(type, count));
    }
    fmt::format_to(out, "{}\n", kLegendEndMarker);
    return fmt::to_string(buffer);
}

std::string LegendGenerator::append(std::string_view sanitized, const TypeCounts& counts) {
    std::string legend = render(counts);
    if (legend.empty()) {
        return std::string(sanitized);
    }
    std::string out;
    out.reserve(sanitized.size() + kLegendSeparator.size() + legend.size());
    out.append(sanitized);
    out.append(kLegendSeparator);
    out.append(legend);
    return out;
}

std::string LegendGenerator::strip(std::string_view text) {
    const auto begin = text.rfind(kLegendBeginMarker);
    if (begin == std::string_view::npos) {
        return std::string(text);
    }
    const auto endMarker = text.find(kLegendEndMarker, begin);
    if (endMarker == std::string_view::npos) {
        return std::string(text);
    }

    // Exact inverse of append()
    std::size_t blockStart = begin;
    if (begin >= kLegendSeparator.size() &&
        text.substr(begin - kLegendSeparator.size(), kLegendSeparator.size()) == kLegendSeparator) {
        blockStart = begin - kLegendSeparator.size();
    } else {
        // Reformatted block: drop from the start of the marker line
        while (blockStart > 0 && text[blockStart - 1] != '\n') {
            --blockStart;
        }
    }

    std::size_t blockEnd = endMarker + kLegendEndMarker.size();
    if (blockEnd < text.size() && text[blockEnd] == '\r') {
        ++blockEnd;
    }
    if (blockEnd < text.size() && text[blockEnd] == '\n') {
        ++blockEnd;
    }

    std::string out;
    out.reserve(text.size() - (blockEnd - blockStart));
    out.append(text.substr(0, blockStart));
    out.append(text.substr(blockEnd));
    return out;
}

}  // namespace docsan::algo
