// =============================================================================
// docsan - Entity Normalizer Implementation
// =============================================================================

#include "docsan/algo/entity_normalizer.h"

#include <algorithm>
#include <map>
#include <utility>

#include "docsan/algo/entity_type.h"
#include "docsan/common/logger.h"

namespace docsan::algo {

std::string normalizeValue(std::string_view type, std::string_view value) {
    const auto* traits = findTypeTraits(type);
    const NormalizationRule rule = traits != nullptr ? traits->rule : NormalizationRule::kDefault;

    switch (rule) {
        case NormalizationRule::kNameLike:
            // Case-insensitive exact match
            return toLowerAscii(value);

        case NormalizationRule::kIdentifier: {
            std::string folded = toLowerAscii(collapseWhitespace(value));
            std::string_view strip = traits->stripChars;
            std::erase_if(folded, [strip](char c) { return strip.find(c) != std::string_view::npos; });
            return folded;
        }

        case NormalizationRule::kDefault:
            break;
    }
    return toLowerAscii(collapseWhitespace(value));
}

NormalizationResult EntityNormalizer::normalize(std::span<const Span> spans) const {
    NormalizationResult result;
    result.occurrences.reserve(spans.size());

    // (type, normalized value) -> entity index
    std::map<std::pair<std::string, std::string>, std::size_t> index;

    for (const auto& span : spans) {
        if (span.length() == 0 || isBlank(span.surface)) {
            ++result.discarded;
            continue;
        }

        std::string normalized = normalizeValue(span.type, span.surface);
        if (normalized.empty()) {
            // Only formatting characters, e.g. a PHONE span of "--"
            ++result.discarded;
            continue;
        }

        auto key = std::make_pair(span.type, normalized);
        auto it = index.find(key);
        std::size_t entityIndex = 0;

        if (it == index.end()) {
            Entity entity;
            entity.id = static_cast<std::uint32_t>(result.entities.size());
            entity.type = span.type;
            entity.canonical = span.surface;
            entity.normalized = std::move(normalized);
            entity.variants.push_back(span.surface);
            entity.firstOffset = span.start;
            entityIndex = result.entities.size();
            result.entities.push_back(std::move(entity));
            index.emplace(std::move(key), entityIndex);
        } else {
            entityIndex = it->second;
            auto& variants = result.entities[entityIndex].variants;
            if (std::find(variants.begin(), variants.end(), span.surface) == variants.end()) {
                variants.push_back(span.surface);
            }
        }

        ++result.entities[entityIndex].occurrences;
        result.occurrences.push_back({span, entityIndex});
    }

    DOCSAN_LOG_DEBUG("Normalized {} spans into {} entities ({} discarded)", spans.size(),
                     result.entities.size(), result.discarded);
    return result;
}

}  // namespace docsan::algo
