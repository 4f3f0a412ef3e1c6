// =============================================================================
// docsan - Placeholder Tokens and Allocation Implementation
// =============================================================================

#include "docsan/algo/placeholder.h"

#include <algorithm>
#include <format>

#include "docsan/common/logger.h"

namespace docsan::algo {

namespace {

/// @brief Largest number of index digits accepted (keeps n within uint32).
constexpr std::size_t kMaxIndexDigits = 9;

/// @brief Bytes of source text quoted by collision errors.
constexpr std::size_t kCollisionExcerptBytes = 40;

VoidResult validateDelimiter(std::string_view delimiter, std::string_view which) {
    if (delimiter.empty()) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             std::format("{} placeholder delimiter must not be empty", which));
    }
    if (delimiter.size() > kMaxDelimiterLength) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             std::format("{} placeholder delimiter is longer than {} bytes", which,
                                         kMaxDelimiterLength));
    }
    for (char c : delimiter) {
        if (isCoreByte(c) || isAsciiSpace(c)) {
            return makeVoidError(
                ErrorCode::kInvalidArgument,
                std::format("{} placeholder delimiter '{}' must not contain letters, digits, "
                            "'_' or whitespace",
                            which, delimiter));
        }
    }
    return makeVoidSuccess();
}

}  // namespace

// =============================================================================
// Delimiters
// =============================================================================

VoidResult Delimiters::validate() const {
    if (auto result = validateDelimiter(open, "opening"); !result) {
        return result;
    }
    return validateDelimiter(close, "closing");
}

// =============================================================================
// Core Tokens
// =============================================================================

std::string PlaceholderToken::core() const {
    return formatCore(type, index);
}

std::string formatCore(std::string_view type, PlaceholderIndex index) {
    return std::format("{}_{}", type, index);
}

std::string formatPlaceholder(const Delimiters& delimiters, std::string_view type,
                              PlaceholderIndex index) {
    return std::format("{}{}_{}{}", delimiters.open, type, index, delimiters.close);
}

std::optional<PlaceholderToken> parseCore(std::string_view core, const CoreParseOptions& options) {
    auto sep = core.rfind('_');
    if (sep == std::string_view::npos || sep == 0 || sep + 1 == core.size()) {
        return std::nullopt;
    }

    std::string_view typePart = core.substr(0, sep);
    std::string_view digits = core.substr(sep + 1);

    if (!std::all_of(typePart.begin(), typePart.end(), [](char c) { return isCoreByte(c); })) {
        return std::nullopt;
    }
    std::string type = options.caseInsensitiveType ? toUpperAscii(typePart) : std::string(typePart);
    if (!isValidTypeTag(type)) {
        return std::nullopt;
    }

    if (!std::all_of(digits.begin(), digits.end(), [](char c) { return isAsciiDigit(c); })) {
        return std::nullopt;
    }
    if (digits.front() == '0') {
        if (!options.acceptZeroPaddedIndex) {
            return std::nullopt;
        }
        auto firstNonZero = digits.find_first_not_of('0');
        if (firstNonZero == std::string_view::npos) {
            return std::nullopt;  // index 0 does not exist
        }
        digits.remove_prefix(firstNonZero);
    }
    if (digits.size() > kMaxIndexDigits) {
        return std::nullopt;
    }

    PlaceholderIndex index = 0;
    for (char c : digits) {
        index = index * 10 + static_cast<PlaceholderIndex>(c - '0');
    }
    return PlaceholderToken{std::move(type), index};
}

// =============================================================================
// Collision Scan
// =============================================================================

std::optional<ByteOffset> findDelimiterCollision(std::string_view source,
                                                 const Delimiters& delimiters) noexcept {
    const auto openPos = source.find(delimiters.open);
    const auto closePos = source.find(delimiters.close);
    const auto first = std::min(openPos, closePos);
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    return first;
}

void checkDelimiterCollision(std::string_view source, const Delimiters& delimiters) {
    if (auto offset = findDelimiterCollision(source, delimiters)) {
        throw PlaceholderCollisionError(*offset,
                                        excerpt(source.substr(*offset), kCollisionExcerptBytes));
    }
}

bool containsBareTokens(std::string_view source, const TypeSet& types) {
    if (types.empty()) {
        return false;
    }

    const CoreParseOptions lenient{.caseInsensitiveType = true, .acceptZeroPaddedIndex = true};
    std::size_t pos = 0;
    while (pos < source.size()) {
        if (!isCoreByte(source[pos])) {
            ++pos;
            continue;
        }
        std::size_t end = pos;
        while (end < source.size() && isCoreByte(source[end])) {
            ++end;
        }
        if (auto token = parseCore(source.substr(pos, end - pos), lenient)) {
            if (types.contains(token->type)) {
                return true;
            }
        }
        pos = end;
    }
    return false;
}

// =============================================================================
// PlaceholderAllocator
// =============================================================================

PlaceholderIndex PlaceholderAllocator::next(std::string_view type) {
    auto it = counters_.find(type);
    if (it == counters_.end()) {
        it = counters_.emplace(std::string(type), 0).first;
    }
    return ++it->second;
}

PlaceholderIndex PlaceholderAllocator::current(std::string_view type) const {
    auto it = counters_.find(type);
    return it == counters_.end() ? 0 : it->second;
}

std::vector<AllocatedPlaceholder> PlaceholderAllocator::allocate(std::span<const Entity> entities) {
    std::vector<AllocatedPlaceholder> placeholders;
    placeholders.reserve(entities.size());

    for (std::size_t i = 0; i < entities.size(); ++i) {
        const auto& entity = entities[i];
        AllocatedPlaceholder placeholder;
        placeholder.entityIndex = i;
        placeholder.token = PlaceholderToken{entity.type, next(entity.type)};
        placeholder.text =
            formatPlaceholder(delimiters_, placeholder.token.type, placeholder.token.index);
        placeholders.push_back(std::move(placeholder));
    }

    DOCSAN_LOG_DEBUG("Allocated {} placeholders across {} types", placeholders.size(),
                     counters_.size());
    return placeholders;
}

// =============================================================================
// PlaceholderTable
// =============================================================================

bool PlaceholderTable::add(std::string core, std::string type, std::string canonical) {
    auto [it, inserted] = canonical_.emplace(std::move(core), std::move(canonical));
    if (inserted) {
        types_.insert(std::move(type));
    }
    return inserted;
}

const std::string* PlaceholderTable::find(std::string_view core) const {
    auto it = canonical_.find(std::string(core));
    return it == canonical_.end() ? nullptr : &it->second;
}

bool PlaceholderTable::hasType(std::string_view type) const {
    return types_.contains(type);
}

}  // namespace docsan::algo
