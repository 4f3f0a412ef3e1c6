// =============================================================================
// docsan - Common Type Helpers Implementation
// =============================================================================

#include "docsan/common/types.h"

#include <algorithm>

namespace docsan {

// =============================================================================
// Entity Type Tags
// =============================================================================

bool isValidTypeTag(std::string_view tag) noexcept {
    if (tag.empty() || tag.size() > kMaxTypeTagLength) {
        return false;
    }
    if (tag.front() < 'A' || tag.front() > 'Z') {
        return false;
    }
    if (tag.back() == '_') {
        return false;
    }
    return std::all_of(tag.begin(), tag.end(), [](char c) {
        return (c >= 'A' && c <= 'Z') || isAsciiDigit(c) || c == '_';
    });
}

std::string canonicalTypeTag(std::string_view tag) {
    auto first = tag.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = tag.find_last_not_of(" \t\r\n");
    return toUpperAscii(tag.substr(first, last - first + 1));
}

// =============================================================================
// ASCII Text Helpers
// =============================================================================

std::string toUpperAscii(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](char c) { return toUpperAscii(c); });
    return result;
}

std::string toLowerAscii(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](char c) { return toLowerAscii(c); });
    return result;
}

bool isBlank(std::string_view text) noexcept {
    return std::all_of(text.begin(), text.end(), [](char c) { return isAsciiSpace(c); });
}

std::string collapseWhitespace(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    bool pendingSpace = false;
    for (char c : text) {
        if (isAsciiSpace(c)) {
            pendingSpace = !result.empty();
            continue;
        }
        if (pendingSpace) {
            result.push_back(' ');
            pendingSpace = false;
        }
        result.push_back(c);
    }
    return result;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (toLowerAscii(a[i]) != toLowerAscii(b[i])) {
            return false;
        }
    }
    return true;
}

std::size_t findIgnoreCase(std::string_view haystack, std::string_view needle,
                           std::size_t from) noexcept {
    if (needle.empty() || haystack.size() < needle.size() || from > haystack.size() - needle.size()) {
        return std::string_view::npos;
    }
    const char first = toLowerAscii(needle.front());
    const std::size_t lastStart = haystack.size() - needle.size();
    for (std::size_t pos = from; pos <= lastStart; ++pos) {
        if (toLowerAscii(haystack[pos]) != first) {
            continue;
        }
        if (equalsIgnoreCase(haystack.substr(pos, needle.size()), needle)) {
            return pos;
        }
    }
    return std::string_view::npos;
}

std::string excerpt(std::string_view text, std::size_t maxBytes) {
    std::size_t cut = std::min(text.size(), maxBytes);
    // Do not split a UTF-8 sequence
    while (cut > 0 && cut < text.size() &&
           (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }

    std::string result;
    result.reserve(cut + 8);
    for (char c : text.substr(0, cut)) {
        if (c == '\n') {
            result += "\\n";
        } else if (c == '\r') {
            result += "\\r";
        } else if (c == '\t') {
            result += "\\t";
        } else {
            result.push_back(c);
        }
    }
    if (cut < text.size()) {
        result += "...";
    }
    return result;
}

}  // namespace docsan
