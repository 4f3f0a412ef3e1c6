// =============================================================================
// docsan - Span List Detector Implementation
// =============================================================================

#include "docsan/detect/span_list_detector.h"

#include <charconv>
#include <format>
#include <string>

#include "docsan/common/error.h"
#include "docsan/common/logger.h"
#include "docsan/io/text_file.h"

namespace docsan::detect {

namespace {

std::vector<std::string_view> splitTabs(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t pos = 0;
    while (true) {
        auto tab = line.find('\t', pos);
        if (tab == std::string_view::npos) {
            fields.push_back(line.substr(pos));
            break;
        }
        fields.push_back(line.substr(pos, tab - pos));
        pos = tab + 1;
    }
    return fields;
}

template <typename T>
bool parseNumber(std::string_view field, T& value) {
    const char* first = field.data();
    const char* last = field.data() + field.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    return ec == std::errc{} && ptr == last && !field.empty();
}

}  // namespace

std::vector<Span> parseSpanList(std::string_view content, std::string_view origin) {
    std::vector<Span> spans;
    std::size_t lineNo = 0;
    std::size_t pos = 0;

    while (pos < content.size()) {
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
        if (isBlank(line) || line.front() == '#') {
            continue;
        }

        auto fields = splitTabs(line);
        if (fields.size() < 3 || fields.size() > 4) {
            throw DetectorUnavailableError(
                std::format("{}:{}: expected start<TAB>end<TAB>TYPE[<TAB>confidence]", origin,
                            lineNo));
        }

        Span span;
        if (!parseNumber(fields[0], span.start) || !parseNumber(fields[1], span.end)) {
            throw DetectorUnavailableError(
                std::format("{}:{}: offsets must be non-negative integers", origin, lineNo));
        }
        span.type = canonicalTypeTag(fields[2]);
        if (!isValidTypeTag(span.type)) {
            throw DetectorUnavailableError(
                std::format("{}:{}: invalid entity type '{}'", origin, lineNo, fields[2]));
        }
        if (fields.size() == 4 && !parseNumber(fields[3], span.confidence)) {
            throw DetectorUnavailableError(
                std::format("{}:{}: invalid confidence '{}'", origin, lineNo, fields[3]));
        }
        spans.push_back(std::move(span));
    }
    return spans;
}

// =============================================================================
// SpanListDetector
// =============================================================================

SpanListDetector::SpanListDetector(std::vector<Span> spans)
    : spans_(std::move(spans)), ready_(true) {}

SpanListDetector::SpanListDetector(std::filesystem::path path) : path_(std::move(path)) {}

void SpanListDetector::prepare() {
    if (ready_) {
        return;
    }
    std::string content;
    try {
        content = io::readTextFile(path_);
    } catch (const IOError& ex) {
        throw DetectorUnavailableError("cannot read span list: " + ex.message(),
                                       ErrorContext(path_.string()));
    }
    spans_ = parseSpanList(content, path_.string());
    ready_ = true;
    DOCSAN_LOG_INFO("Span list loaded: {} ({} spans)", path_.string(), spans_.size());
}

void SpanListDetector::release() noexcept {
    if (!path_.empty()) {
        spans_.clear();
        ready_ = false;
    }
}

std::vector<Span> SpanListDetector::scan(std::string_view text) const {
    if (!ready_) {
        throw DetectorUnavailableError("span list detector used before prepare()");
    }
    std::vector<Span> spans = spans_;
    for (auto& span : spans) {
        if (span.start < span.end && span.end <= text.size()) {
            span.surface = std::string(text.substr(span.start, span.end - span.start));
        }
    }
    return spans;
}

}  // namespace docsan::detect
