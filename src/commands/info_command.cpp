// =============================================================================
// docsan - Info Command Implementation
// =============================================================================

#include "info_command.h"

#include <iterator>

#include <fmt/format.h>

#include "docsan/common/logger.h"
#include "docsan/format/mapping_format.h"
#include "docsan/format/mapping_reader.h"

namespace docsan::commands {

namespace {

std::string versionString(std::uint8_t version) {
    return fmt::format("{}.{}", format::decodeMajorVersion(version), format::decodeMinorVersion(version));
}

std::string flagsString(const format::MappingHeader& header) {
    std::string out;
    if (header.sourceHasBareTokens()) {
        out += "source-has-bare-tokens ";
    }
    if (header.hasLegend()) {
        out += "legend ";
    }
    if (out.empty()) {
        return "none";
    }
    out.pop_back();
    return out;
}

}  // namespace

std::string jsonEscape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    for (char c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

// =============================================================================
// InfoCommand Implementation
// =============================================================================

InfoCommand::InfoCommand(InfoOptions options) : options_(std::move(options)) {}

int InfoCommand::execute() {
    const auto artifact = format::MappingReader::load(options_.inputPath);
    const std::string rendered = options_.jsonOutput ? renderJson(artifact) : renderText(artifact);
    fmt::print("{}", rendered);
    return 0;
}

std::string InfoCommand::renderText(const format::MappingArtifact& artifact) const {
    const auto& header = artifact.header();
    fmt::memory_buffer out;
    auto it = std::back_inserter(out);

    fmt::format_to(it, "=== docsan Mapping Information ===\n\n");
    fmt::format_to(it, "File:                  {}\n", options_.inputPath.string());
    fmt::format_to(it, "Version:               {}\n", versionString(header.version));
    fmt::format_to(it, "Flags:                 {}\n", flagsString(header));
    fmt::format_to(it, "Delimiters:            {} {}\n", header.delimiters.open,
                   header.delimiters.close);
    fmt::format_to(it, "Source length:         {} bytes\n", header.sourceLength);
    fmt::format_to(it, "Source fingerprint:    {:016x}\n", header.sourceFingerprint);
    fmt::format_to(it, "Sanitized fingerprint: {:016x}\n", header.sanitizedFingerprint);
    fmt::format_to(it, "Placeholders:          {}\n", artifact.size());

    fmt::format_to(it, "\n--- Types ---\n");
    for (const auto& [type, count] : artifact.countByType()) {
        fmt::format_to(it, "  {:<14} {}\n", type, count);
    }

    fmt::format_to(it, "\n--- Entries ---\n");
    for (const auto& entry : artifact.entries()) {
        fmt::format_to(it, "  {:<20} occurrences={:<4} variants={}", entry.core(), entry.occurrences,
                       entry.variants.size());
        if (options_.showValues) {
            fmt::format_to(it, "  \"{}\"", jsonEscape(entry.canonical));
        }
        fmt::format_to(it, "\n");
        if (options_.showValues) {
            for (const auto& variant : entry.variants) {
                if (variant != entry.canonical) {
                    fmt::format_to(it, "      ~ \"{}\"\n", jsonEscape(variant));
                }
            }
        }
    }
    return fmt::to_string(out);
}

std::string InfoCommand::renderJson(const format::MappingArtifact& artifact) const {
    const auto& header = artifact.header();
    fmt::memory_buffer out;
    auto it = std::back_inserter(out);

    fmt::format_to(it, "{{\n");
    fmt::format_to(it, "  \"file\": \"{}\",\n", jsonEscape(options_.inputPath.string()));
    fmt::format_to(it, "  \"version\": {{\"major\": {}, \"minor\": {}}},\n",
                   format::decodeMajorVersion(header.version),
                   format::decodeMinorVersion(header.version));
    fmt::format_to(it, "  \"flags\": {},\n", header.flags);
    fmt::format_to(it, "  \"source_has_bare_tokens\": {},\n", header.sourceHasBareTokens());
    fmt::format_to(it, "  \"has_legend\": {},\n", header.hasLegend());
    fmt::format_to(it, "  \"delimiters\": [\"{}\", \"{}\"],\n", jsonEscape(header.delimiters.open),
                   jsonEscape(header.delimiters.close));
    fmt::format_to(it, "  \"source_length\": {},\n", header.sourceLength);
    fmt::format_to(it, "  \"source_fingerprint\": \"{:016x}\",\n", header.sourceFingerprint);
    fmt::format_to(it, "  \"sanitized_fingerprint\": \"{:016x}\",\n", header.sanitizedFingerprint);
    fmt::format_to(it, "  \"entries\": [");

    bool first = true;
    for (const auto& entry : artifact.entries()) {
        fmt::format_to(it, "{}\n    {{\"placeholder\": \"{}\", \"type\": \"{}\", \"index\": {}, "
                           "\"occurrences\": {}, \"variant_count\": {}",
                       first ? "" : ",", entry.core(), entry.type, entry.index, entry.occurrences,
                       entry.variants.size());
        if (options_.showValues) {
            fmt::format_to(it, ", \"canonical\": \"{}\", \"variants\": [", jsonEscape(entry.canonical));
            for (std::size_t i = 0; i < entry.variants.size(); ++i) {
                fmt::format_to(it, "{}\"{}\"", i == 0 ? "" : ", ", jsonEscape(entry.variants[i]));
            }
            fmt::format_to(it, "]");
        }
        fmt::format_to(it, "}}");
        first = false;
    }
    fmt::format_to(it, "{}]\n}}\n", artifact.empty() ? "" : "\n  ");
    return fmt::to_string(out);
}

}  // namespace docsan::commands
