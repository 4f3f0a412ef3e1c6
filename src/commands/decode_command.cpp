// =============================================================================
// docsan - Decode Command Implementation
// =============================================================================

#include "decode_command.h"

#include <optional>
#include <string>

#include <fmt/format.h>

#include "docsan/common/error.h"
#include "docsan/common/logger.h"
#include "docsan/io/text_file.h"

namespace docsan::commands {

namespace {

constexpr std::string_view kRestoredSuffix = "_restored";

}  // namespace

DecodeCommand::DecodeCommand(DecodeCommandOptions options) : options_(std::move(options)) {}

int DecodeCommand::execute() {
    auto session = pipeline::DecodeSession::load(options_.mappingPath, options_.decode);
    const std::string text = io::readTextFile(options_.inputPath);

    std::optional<std::string> original;
    if (!options_.sourcePath.empty()) {
        original = io::readTextFile(options_.sourcePath);
    }

    const auto report =
        original ? session.run(text, std::string_view(*original)) : session.run(text);

    const std::filesystem::path output =
        options_.outputPath.empty()
            ? io::derivePath(options_.inputPath, kRestoredSuffix,
                             options_.inputPath.extension().string())
            : options_.outputPath;

    if (output == io::kStdStreamPath) {
        io::writeToStdout(report.restored);
    } else {
        io::writeTextFile(output, report.restored, options_.forceOverwrite);
        DOCSAN_LOG_INFO("Restored {} placeholders -> {}", report.resolvedCount, output.string());
    }

    if (report.fingerprint == pipeline::FingerprintCheck::kMismatch) {
        fmt::print(stderr, "warning: {} does not match the document this mapping was made from\n",
                   options_.sourcePath.string());
    }
    if (report.bareTokensRefused) {
        fmt::print(stderr, "warning: --bare-tokens ignored; the original document contained "
                           "undelimited TYPE_n text\n");
    }
    reportUnresolved(report);

    if (options_.failOnUnresolved && !report.complete()) {
        return toExitCode(ErrorCode::kMappingFileError);
    }
    return 0;
}

void DecodeCommand::reportUnresolved(const pipeline::DecodeReport& report) const {
    if (report.unresolved.empty()) {
        return;
    }
    fmt::print(stderr, "{} unresolved placeholder(s):\n", report.unresolved.size());
    for (const auto& token : report.unresolved) {
        fmt::print(stderr, "  {} at byte {}: {}\n", token.token, token.offset,
                   excerpt(token.raw, 64));
    }
}

}  // namespace docsan::commands
