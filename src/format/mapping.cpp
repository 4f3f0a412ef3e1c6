// =============================================================================
// docsan - Mapping Artifact Model Implementation
// =============================================================================

#include "docsan/format/mapping.h"

#include <algorithm>
#include <format>
#include <set>
#include <utility>

#include <xxhash.h>

#include "docsan/algo/entity_normalizer.h"

namespace docsan::format {

Checksum fingerprint(std::string_view text) noexcept {
    return XXH64(text.data(), text.size(), 0);
}

// =============================================================================
// MappingArtifact
// =============================================================================

MappingArtifact::MappingArtifact(MappingHeader header, std::vector<MappingEntry> entries)
    : header_(std::move(header)), entries_(std::move(entries)) {
    if (auto result = buildIndexes(); !result) {
        throw MappingFileError(result.error().message());
    }
}

Result<MappingArtifact> MappingArtifact::create(MappingHeader header,
                                                std::vector<MappingEntry> entries) {
    MappingArtifact artifact;
    artifact.header_ = std::move(header);
    artifact.entries_ = std::move(entries);
    if (auto result = artifact.buildIndexes(); !result) {
        return std::unexpected(result.error());
    }
    return artifact;
}

VoidResult MappingArtifact::buildIndexes() {
    if (auto result = header_.delimiters.validate(); !result) {
        return makeVoidError(ErrorCode::kMappingFileError,
                             "invalid delimiters: " + result.error().message());
    }

    byPlaceholder_.clear();
    byVariant_.clear();
    byPlaceholder_.reserve(entries_.size());

    // (type, normalized canonical) pairs already seen
    std::set<std::pair<std::string, std::string>> values;

    for (std::size_t i = 0; i < entries_.size(); ++i) {
        auto& entry = entries_[i];

        if (!isValidTypeTag(entry.type)) {
            return makeVoidError(ErrorCode::kMappingFileError,
                                 std::format("entry {}: invalid type tag", i));
        }
        if (entry.index == 0) {
            return makeVoidError(ErrorCode::kMappingFileError,
                                 std::format("entry {}: placeholder index must be >= 1", i));
        }
        if (entry.canonical.empty()) {
            return makeVoidError(ErrorCode::kMappingFileError,
                                 std::format("entry {}: empty canonical value", i));
        }

        std::string core = entry.core();
        if (!byPlaceholder_.emplace(core, i).second) {
            return makeVoidError(ErrorCode::kMappingFileError,
                                 std::format("duplicate placeholder {}", core));
        }

        if (!values.emplace(entry.type, algo::normalizeValue(entry.type, entry.canonical)).second) {
            return makeVoidError(
                ErrorCode::kMappingFileError,
                std::format("placeholder {} duplicates the value of another {} placeholder", core,
                            entry.type));
        }

        std::sort(entry.variants.begin(), entry.variants.end());
        entry.variants.erase(std::unique(entry.variants.begin(), entry.variants.end()),
                             entry.variants.end());

        byVariant_.emplace(entry.canonical, core);
        for (const auto& variant : entry.variants) {
            byVariant_.emplace(variant, core);
        }
    }

    return makeVoidSuccess();
}

const MappingEntry* MappingArtifact::findByPlaceholder(std::string_view core) const {
    auto it = byPlaceholder_.find(std::string(core));
    return it == byPlaceholder_.end() ? nullptr : &entries_[it->second];
}

const std::string* MappingArtifact::findByVariant(std::string_view variant) const {
    auto it = byVariant_.find(std::string(variant));
    return it == byVariant_.end() ? nullptr : &it->second;
}

algo::PlaceholderTable MappingArtifact::placeholderTable() const {
    algo::PlaceholderTable table;
    for (const auto& entry : entries_) {
        table.add(entry.core(), entry.type, entry.canonical);
    }
    return table;
}

std::map<std::string, std::size_t, std::less<>> MappingArtifact::countByType() const {
    std::map<std::string, std::size_t, std::less<>> counts;
    for (const auto& entry : entries_) {
        ++counts[entry.type];
    }
    return counts;
}

}  // namespace docsan::format
