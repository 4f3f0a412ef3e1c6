// =============================================================================
// docsan - Pattern Detector Implementation
// =============================================================================

#include "docsan/detect/pattern_detector.h"

#include <algorithm>
#include <regex>

#include "docsan/common/error.h"
#include "docsan/common/logger.h"

namespace docsan::detect {

namespace {

constexpr double kEmailConfidence = 0.99;
constexpr double kIbanConfidence = 0.99;
constexpr double kCardConfidence = 0.95;
constexpr double kSsnConfidence = 0.9;
constexpr double kUrlConfidence = 0.9;
constexpr double kDateConfidence = 0.85;
constexpr double kPhoneConfidence = 0.8;

constexpr std::size_t kMinPhoneDigits = 7;
constexpr std::size_t kMaxPhoneDigits = 15;

std::size_t countDigits(std::string_view text) noexcept {
    return static_cast<std::size_t>(
        std::count_if(text.begin(), text.end(), [](char c) { return isAsciiDigit(c); }));
}

Span makeSpan(std::string_view text, std::size_t start, std::size_t length, std::string_view type,
              double confidence) {
    Span span;
    span.start = start;
    span.end = start + length;
    span.type = std::string(type);
    span.confidence = confidence;
    span.surface = std::string(text.substr(start, length));
    return span;
}

/// @brief Visit every match of @p re in @p text as (offset, length).
template <typename Visitor>
void forEachMatch(const std::regex& re, std::string_view text, Visitor&& visit) {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    for (std::cregex_iterator it(begin, end, re), last; it != last; ++it) {
        const auto& match = *it;
        visit(static_cast<std::size_t>(match.position(0)), static_cast<std::size_t>(match.length(0)));
    }
}

}  // namespace

// =============================================================================
// Checksums
// =============================================================================

bool isValidIban(std::string_view iban) noexcept {
    std::string compact;
    compact.reserve(iban.size());
    for (char c : iban) {
        if (c != ' ') {
            compact.push_back(toUpperAscii(c));
        }
    }
    if (compact.size() < 15 || compact.size() > 34) {
        return false;
    }

    // Rearranged: BBAN + country code + check digits
    std::rotate(compact.begin(), compact.begin() + 4, compact.end());

    unsigned remainder = 0;
    for (char c : compact) {
        if (isAsciiDigit(c)) {
            remainder = (remainder * 10 + static_cast<unsigned>(c - '0')) % 97;
        } else if (c >= 'A' && c <= 'Z') {
            const unsigned value = static_cast<unsigned>(c - 'A') + 10;
            remainder = (remainder * 100 + value) % 97;
        } else {
            return false;
        }
    }
    return remainder == 1;
}

bool passesLuhn(std::string_view number) noexcept {
    std::string digits;
    for (char c : number) {
        if (isAsciiDigit(c)) {
            digits.push_back(c);
        }
    }
    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool doubleIt = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int digit = *it - '0';
        if (doubleIt) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        doubleIt = !doubleIt;
    }
    return sum % 10 == 0;
}

bool looksMasked(std::string_view value) noexcept {
    return value.find("XX") != std::string_view::npos || value.find("***") != std::string_view::npos;
}

// =============================================================================
// PatternDetector
// =============================================================================

struct PatternDetector::Patterns {
    std::regex email;
    std::regex iban;
    std::regex card;
    std::regex phone;
    std::regex ssn;
    std::regex date;
    std::regex dateCue;
    std::regex url;
};

PatternDetector::PatternDetector(PatternOptions options) : options_(options) {}

PatternDetector::~PatternDetector() = default;

void PatternDetector::prepare() {
    if (patterns_ != nullptr) {
        return;
    }

    try {
        auto patterns = std::make_unique<Patterns>();
        patterns->email = std::regex(R"([A-Za-z0-9._%+-]+@[A-Za-z0-9-]+(?:\.[A-Za-z0-9-]+)*\.[A-Za-z]{2,})");
        patterns->iban = std::regex(R"(\b[A-Z]{2}[0-9]{2}(?: ?[A-Z0-9]{4}){2,7}(?: ?[A-Z0-9]{1,3})?\b)");
        patterns->card = std::regex(R"(\b\d(?:[ -]?\d){12,18}\b)");
        patterns->phone = std::regex(
            R"((?:\+\d{1,3}[ .-]?)?(?:\(\d{1,4}\)[ .-]?)?\d{2,4}(?:[ ./-]\d{2,5}){1,4}\b)");
        patterns->ssn = std::regex(R"(\b\d{3}-\d{2}-\d{4}\b)");
        patterns->date = std::regex(
            R"(\b(?:\d{1,2}[./-]\d{1,2}[./-](?:19|20)\d{2}|(?:19|20)\d{2}-\d{2}-\d{2}|\d{1,2}\.? (?:january|february|march|april|may|june|july|august|september|october|november|december) (?:19|20)\d{2})\b)",
            std::regex::ECMAScript | std::regex::icase);
        patterns->dateCue = std::regex(R"(\b(?:born|birth|birthday|dob|d\.o\.b|geboren)\b)",
                                       std::regex::ECMAScript | std::regex::icase);
        patterns->url = std::regex(R"(\bhttps?://[^\s<>"'\)\]]+)", std::regex::ECMAScript | std::regex::icase);
        patterns_ = std::move(patterns);
    } catch (const std::regex_error& ex) {
        throw DetectorUnavailableError(std::string("failed to compile detector patterns: ") +
                                       ex.what());
    }

    DOCSAN_LOG_DEBUG("Pattern detector prepared");
}

void PatternDetector::release() noexcept {
    patterns_.reset();
}

std::vector<Span> PatternDetector::scan(std::string_view text) const {
    if (patterns_ == nullptr) {
        throw DetectorUnavailableError("pattern detector used before prepare()");
    }
    const auto& p = *patterns_;

    std::vector<Span> spans;
    auto emit = [&](std::size_t start, std::size_t length, std::string_view type,
                    double confidence) {
        if (options_.skipMasked && looksMasked(text.substr(start, length))) {
            DOCSAN_LOG_DEBUG("Skipping masked {} value at {}", type, start);
            return;
        }
        spans.push_back(makeSpan(text, start, length, type, confidence));
    };

    forEachMatch(p.email, text, [&](std::size_t pos, std::size_t len) {
        emit(pos, len, "EMAIL", kEmailConfidence);
    });

    forEachMatch(p.iban, text, [&](std::size_t pos, std::size_t len) {
        if (isValidIban(text.substr(pos, len))) {
            emit(pos, len, "IBAN", kIbanConfidence);
        }
    });

    forEachMatch(p.card, text, [&](std::size_t pos, std::size_t len) {
        if (passesLuhn(text.substr(pos, len))) {
            emit(pos, len, "CREDIT_CARD", kCardConfidence);
        }
    });

    forEachMatch(p.ssn, text, [&](std::size_t pos, std::size_t len) {
        emit(pos, len, "ID", kSsnConfidence);
    });

    forEachMatch(p.url, text, [&](std::size_t pos, std::size_t len) {
        // Sentence punctuation is not part of the URL
        while (len > 0 && std::string_view(".,;:!?").find(text[pos + len - 1]) != std::string_view::npos) {
            --len;
        }
        if (len > 0) {
            emit(pos, len, "URL", kUrlConfidence);
        }
    });

    forEachMatch(p.date, text, [&](std::size_t pos, std::size_t len) {
        if (options_.requireDateContext) {
            const std::size_t windowStart =
                pos > options_.dateContextWindow ? pos - options_.dateContextWindow : 0;
            const std::string window(text.substr(windowStart, pos - windowStart));
            if (!std::regex_search(window, p.dateCue)) {
                return;
            }
        }
        emit(pos, len, "DOB", kDateConfidence);
    });

    forEachMatch(p.phone, text, [&](std::size_t pos, std::size_t len) {
        // No lookbehind in ECMAScript: reject matches that start inside a word
        if (pos > 0 && isWordByte(text[pos - 1])) {
            return;
        }
        std::string_view value = text.substr(pos, len);
        const std::size_t digits = countDigits(value);
        if (digits < kMinPhoneDigits || digits > kMaxPhoneDigits) {
            return;
        }
        const std::string candidate(value);
        if (std::regex_match(candidate, p.date)) {
            return;
        }
        emit(pos, len, "PHONE", kPhoneConfidence);
    });

    return spans;
}

}  // namespace docsan::detect
