// =============================================================================
// docsan - Dictionary Detector Implementation
// =============================================================================

#include "docsan/detect/dictionary_detector.h"

#include <algorithm>
#include <format>

#include "docsan/common/error.h"
#include "docsan/common/logger.h"
#include "docsan/io/text_file.h"

namespace docsan::detect {

namespace {

constexpr double kDictionaryConfidence = 0.9;

std::string_view trim(std::string_view text) {
    while (!text.empty() && isAsciiSpace(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && isAsciiSpace(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

bool onWordBoundary(std::string_view text, std::size_t pos, std::size_t len) noexcept {
    if (isWordByte(text[pos]) && pos > 0 && isWordByte(text[pos - 1])) {
        return false;
    }
    const std::size_t end = pos + len;
    if (isWordByte(text[end - 1]) && end < text.size() && isWordByte(text[end])) {
        return false;
    }
    return true;
}

}  // namespace

std::vector<DictionaryTerm> parseDictionary(std::string_view content, std::string_view origin) {
    std::vector<DictionaryTerm> terms;
    std::size_t lineNo = 0;
    std::size_t pos = 0;

    while (pos <= content.size()) {
        auto eol = content.find('\n', pos);
        if (eol == std::string_view::npos) {
            eol = content.size();
        }
        std::string_view line = content.substr(pos, eol - pos);
        pos = eol + 1;
        ++lineNo;

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (trim(line).empty() || trim(line).front() == '#') {
            continue;
        }

        auto tab = line.find('\t');
        if (tab == std::string_view::npos) {
            throw DetectorUnavailableError(
                std::format("{}:{}: expected TYPE<TAB>term", origin, lineNo));
        }

        std::string type = canonicalTypeTag(line.substr(0, tab));
        std::string_view term = trim(line.substr(tab + 1));
        if (!isValidTypeTag(type)) {
            throw DetectorUnavailableError(
                std::format("{}:{}: invalid entity type '{}'", origin, lineNo, type));
        }
        if (term.empty()) {
            throw DetectorUnavailableError(std::format("{}:{}: empty term", origin, lineNo));
        }
        terms.push_back({std::move(type), std::string(term)});
    }
    return terms;
}

// =============================================================================
// DictionaryDetector
// =============================================================================

DictionaryDetector::DictionaryDetector(std::vector<DictionaryTerm> terms)
    : terms_(std::move(terms)), ready_(true) {
    sortTerms();
}

DictionaryDetector::DictionaryDetector(std::filesystem::path path) : path_(std::move(path)) {}

void DictionaryDetector::prepare() {
    if (ready_) {
        return;
    }
    std::string content;
    try {
        content = io::readTextFile(path_);
    } catch (const IOError& ex) {
        throw DetectorUnavailableError("cannot read dictionary: " + ex.message(),
                                       ErrorContext(path_.string()));
    }
    terms_ = parseDictionary(content, path_.string());
    sortTerms();
    ready_ = true;
    DOCSAN_LOG_INFO("Dictionary loaded: {} ({} terms)", path_.string(), terms_.size());
}

void DictionaryDetector::release() noexcept {
    if (!path_.empty()) {
        terms_.clear();
        ready_ = false;
    }
}

void DictionaryDetector::sortTerms() {
    // Longer terms first so "Acme Corp" is reported before "Acme"
    std::stable_sort(terms_.begin(), terms_.end(),
                     [](const DictionaryTerm& a, const DictionaryTerm& b) {
                         return a.term.size() > b.term.size();
                     });
}

std::vector<Span> DictionaryDetector::scan(std::string_view text) const {
    if (!ready_) {
        throw DetectorUnavailableError("dictionary detector used before prepare()");
    }

    std::vector<Span> spans;
    for (const auto& entry : terms_) {
        std::size_t pos = findIgnoreCase(text, entry.term, 0);
        while (pos != std::string_view::npos) {
            if (onWordBoundary(text, pos, entry.term.size())) {
                Span span;
                span.start = pos;
                span.end = pos + entry.term.size();
                span.type = entry.type;
                span.confidence = kDictionaryConfidence;
                span.surface = std::string(text.substr(pos, entry.term.size()));
                spans.push_back(std::move(span));
            }
            pos = findIgnoreCase(text, entry.term, pos + 1);
        }
    }
    return spans;
}

}  // namespace docsan::detect
