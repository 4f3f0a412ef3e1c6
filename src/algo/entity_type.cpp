// =============================================================================
// docsan - Entity Type Traits Implementation
// =============================================================================

#include "docsan/algo/entity_type.h"

#include <algorithm>
#include <array>
#include <charconv>
#include <format>

#include "docsan/common/types.h"

namespace docsan::algo {

namespace {

// Financial identifiers and emails outrank generic names.
constexpr std::array<EntityTypeTraits, 15> kBuiltinTypes = {{
    {"EMAIL", 100, NormalizationRule::kIdentifier, "", "email address", "email addresses"},
    {"IBAN", 95, NormalizationRule::kIdentifier, " -", "bank account number",
     "bank account numbers"},
    {"CREDIT_CARD", 95, NormalizationRule::kIdentifier, " -", "card number", "card numbers"},
    {"ID", 90, NormalizationRule::kIdentifier, " -.", "identification number",
     "identification numbers"},
    {"PHONE", 85, NormalizationRule::kIdentifier, " -()./", "phone number", "phone numbers"},
    {"DOB", 80, NormalizationRule::kDefault, "", "date of birth", "dates of birth"},
    {"URL", 75, NormalizationRule::kDefault, "", "web address", "web addresses"},
    {"ADDRESS", 70, NormalizationRule::kDefault, "", "address", "addresses"},
    {"STREET", 60, NormalizationRule::kDefault, "", "street address", "street addresses"},
    {"ROAD", 55, NormalizationRule::kDefault, "", "road", "roads"},
    {"VEHICLE", 50, NormalizationRule::kDefault, "", "vehicle registration",
     "vehicle registrations"},
    {"ORG", 40, NormalizationRule::kNameLike, "", "organization", "organizations"},
    {"PLACE", 35, NormalizationRule::kDefault, "", "place", "places"},
    {"LOCATION", 35, NormalizationRule::kDefault, "", "location", "locations"},
    {"PERSON", 30, NormalizationRule::kNameLike, "", "person name", "person names"},
}};

}  // namespace

const EntityTypeTraits* findTypeTraits(std::string_view tag) noexcept {
    auto it = std::find_if(kBuiltinTypes.begin(), kBuiltinTypes.end(),
                           [tag](const EntityTypeTraits& traits) { return traits.tag == tag; });
    return it == kBuiltinTypes.end() ? nullptr : &*it;
}

std::span<const EntityTypeTraits> knownTypes() noexcept {
    return kBuiltinTypes;
}

std::string typeNoun(std::string_view tag, std::size_t count) {
    if (const auto* traits = findTypeTraits(tag)) {
        return std::string(count == 1 ? traits->singular : traits->plural);
    }
    std::string noun = toLowerAscii(tag);
    std::replace(noun.begin(), noun.end(), '_', ' ');
    noun += count == 1 ? " value" : " values";
    return noun;
}

// =============================================================================
// PriorityTable
// =============================================================================

int PriorityTable::priorityOf(std::string_view tag) const {
    if (auto it = overrides_.find(tag); it != overrides_.end()) {
        return it->second;
    }
    if (const auto* traits = findTypeTraits(tag)) {
        return traits->priority;
    }
    return kUnknownTypePriority;
}

void PriorityTable::set(std::string tag, int priority) {
    overrides_[std::move(tag)] = priority;
}

VoidResult PriorityTable::applyOverride(std::string_view spec) {
    auto eq = spec.find('=');
    if (eq == std::string_view::npos) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             std::format("priority override must be TYPE=PRIORITY: '{}'", spec));
    }

    std::string tag = canonicalTypeTag(spec.substr(0, eq));
    if (!isValidTypeTag(tag)) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             std::format("invalid entity type in priority override: '{}'", spec));
    }

    std::string_view number = spec.substr(eq + 1);
    int priority = 0;
    auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), priority);
    if (ec != std::errc{} || ptr != number.data() + number.size()) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             std::format("invalid priority value in override: '{}'", spec));
    }

    set(std::move(tag), priority);
    return makeVoidSuccess();
}

}  // namespace docsan::algo
