// =============================================================================
// docsan - Reversible Document Sanitizer
// =============================================================================
// Main entry point for the docsan command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: encode, decode, analyze, info
// - Global options: threads, verbosity, log file, config file
// - Exit codes taken from docsan::ErrorCode
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "docsan/common/error.h"
#include "docsan/common/logger.h"
#include "docsan/common/types.h"
#include "docsan/io/atomic_file.h"
#include "docsan/io/text_file.h"

// Command implementations
#include "commands/analyze_command.h"
#include "commands/decode_command.h"
#include "commands/encode_command.h"
#include "commands/info_command.h"

namespace docsan::commands {
int runEncode(CLI::App* app);
int runDecode(CLI::App* app);
int runAnalyze(CLI::App* app);
int runInfo(CLI::App* app);
}  // namespace docsan::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "docsan: reversible document sanitization\n"
    "Replaces sensitive values with stable placeholders (e.g. PERSON_1) before a\n"
    "document is shared, and restores them in the returned text from a local\n"
    "mapping file. The mapping file is not encrypted; keep it private.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::size_t threads = 0;  // 0 = auto-detect
    int verbosity = 0;        // 0 = normal, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Encode Command Options
// =============================================================================

struct CliEncodeOptions {
    std::vector<std::string> inputs;
    std::string output;
    std::string outputDir;
    std::string mapping;
    std::vector<std::string> detectors;
    std::string dictionary;
    std::string spans;
    std::vector<std::string> priorities;  // TYPE=N overrides
    std::string openDelimiter{docsan::algo::kDefaultOpenDelimiter};
    std::string closeDelimiter{docsan::algo::kDefaultCloseDelimiter};
    std::size_t minSweepLength = docsan::kDefaultMinSweepLength;
    bool sweep = true;
    bool leakCheck = true;
    bool legend = false;
    bool skipMasked = false;
    bool dryRun = false;
    bool stats = false;
    bool force = false;
};

CliEncodeOptions gEncodeOpts;

// =============================================================================
// Decode Command Options
// =============================================================================

struct CliDecodeOptions {
    std::string input;
    std::string mapping;
    std::string output;
    std::string source;
    std::size_t maxInnerWhitespace = 2;
    bool stripLegend = false;
    bool bareTokens = false;
    bool zeroPadded = false;
    bool strict = false;
    bool failOnUnresolved = false;
    bool force = false;
};

CliDecodeOptions gDecodeOpts;

// =============================================================================
// Analyze Command Options
// =============================================================================

struct CliAnalyzeOptions {
    std::string input;
    std::vector<std::string> detectors;
    std::string dictionary;
    std::string spans;
    std::vector<std::string> priorities;
    std::size_t examples = 5;
    bool skipMasked = false;
};

CliAnalyzeOptions gAnalyzeOpts;

// =============================================================================
// Info Command Options
// =============================================================================

struct CliInfoOptions {
    std::string input;
    bool json = false;
    bool showValues = false;
};

CliInfoOptions gInfoOpts;

// =============================================================================
// Helpers
// =============================================================================

/// @brief Detector names offered on the command line ("none" disables detection).
std::vector<std::string> detectorChoices() {
    std::vector<std::string> names;
    for (auto name : docsan::detect::availableDetectors()) {
        names.emplace_back(name);
    }
    names.emplace_back("none");
    return names;
}

docsan::algo::PriorityTable buildPriorityTable(const std::vector<std::string>& overrides) {
    docsan::algo::PriorityTable table;
    for (const auto& spec : overrides) {
        docsan::unwrapOrThrow(table.applyOverride(spec));
    }
    return table;
}

/// @brief True when the selected subcommand writes its main output to stdout.
bool writesToStdout(const CLI::App& app) {
    if (app.got_subcommand("encode")) {
        return gEncodeOpts.output == docsan::io::kStdStreamPath;
    }
    if (app.got_subcommand("decode")) {
        return gDecodeOpts.output == docsan::io::kStdStreamPath;
    }
    return false;
}

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupEncodeCommand(CLI::App& app) {
    auto* encode = app.add_subcommand("encode", "Sanitize document(s) and write mapping file(s)");
    encode->alias("e");

    encode->add_option("-i,--input", gEncodeOpts.inputs, "Input document(s) (UTF-8 text)")
        ->required()
        ->check(CLI::ExistingFile);

    encode->add_option("-o,--output", gEncodeOpts.output,
                       "Sanitized output (single input; '-' for stdout)");

    encode->add_option("--output-dir", gEncodeOpts.outputDir,
                       "Directory for <stem>_sanitized<ext> and <stem>.dsm")
        ->check(CLI::ExistingDirectory);

    encode->add_option("-m,--mapping", gEncodeOpts.mapping, "Mapping file (single input)");

    encode->add_option("--detector", gEncodeOpts.detectors,
                       "Detector(s) to run: pattern, dictionary, spans, none")
        ->check(CLI::IsMember(detectorChoices()));

    encode->add_option("--dictionary", gEncodeOpts.dictionary, "Dictionary file (TYPE<TAB>term)")
        ->check(CLI::ExistingFile);

    encode->add_option("--spans", gEncodeOpts.spans,
                       "Precomputed span file (start<TAB>end<TAB>TYPE[<TAB>confidence])")
        ->check(CLI::ExistingFile);

    encode->add_option("--priority", gEncodeOpts.priorities,
                       "Override an overlap priority, e.g. ORG=75 (repeatable)");

    encode->add_option("--open-delimiter", gEncodeOpts.openDelimiter, "Placeholder opening delimiter");
    encode->add_option("--close-delimiter", gEncodeOpts.closeDelimiter,
                       "Placeholder closing delimiter");

    encode->add_option("--min-sweep-length", gEncodeOpts.minSweepLength,
                       "Shortest value (bytes) swept for undetected occurrences")
        ->check(CLI::PositiveNumber);

    encode->add_flag("--sweep,!--no-sweep", gEncodeOpts.sweep,
                     "Replace undetected occurrences of detected values");

    encode->add_flag("--leak-check,!--no-leak-check", gEncodeOpts.leakCheck,
                     "Fail a document if a detected value survives");

    encode->add_flag("--legend,!--no-legend", gEncodeOpts.legend,
                     "Append a value-free legend to the sanitized text");

    encode->add_flag("--skip-masked", gEncodeOpts.skipMasked,
                     "Do not replace values that are already masked (XX, ***)");

    encode->add_flag("--dry-run", gEncodeOpts.dryRun, "Run detection and substitution only");

    encode->add_flag("--stats", gEncodeOpts.stats, "Print per-document statistics to stderr");

    encode->add_flag("-f,--force", gEncodeOpts.force, "Overwrite existing output files");
}

void setupDecodeCommand(CLI::App& app) {
    auto* decode = app.add_subcommand("decode", "Restore original values in returned text");
    decode->alias("d");

    decode->add_option("-i,--input", gDecodeOpts.input, "Text containing placeholders")
        ->required()
        ->check(CLI::ExistingFile);

    decode->add_option("-m,--mapping", gDecodeOpts.mapping, "Mapping file written by encode")
        ->required()
        ->check(CLI::ExistingFile);

    decode->add_option("-o,--output", gDecodeOpts.output,
                       "Restored output ('-' for stdout; default <stem>_restored<ext>)");

    decode->add_option("--source", gDecodeOpts.source,
                       "Original document, checked against the mapping fingerprint")
        ->check(CLI::ExistingFile);

    decode->add_option("--max-inner-whitespace", gDecodeOpts.maxInnerWhitespace,
                       "Whitespace bytes tolerated inside the delimiters")
        ->check(CLI::Range(0, 16));

    decode->add_flag("--strip-legend", gDecodeOpts.stripLegend, "Remove a legend block first");

    decode->add_flag("--bare-tokens", gDecodeOpts.bareTokens,
                     "Also restore undelimited TYPE_n words");

    decode->add_flag("--zero-padded", gDecodeOpts.zeroPadded,
                     "Accept zero-padded indexes (PERSON_001)");

    decode->add_flag("--strict", gDecodeOpts.strict,
                     "Only exact placeholders (no case, whitespace or emphasis tolerance)");

    decode->add_flag("--fail-on-unresolved", gDecodeOpts.failOnUnresolved,
                     "Exit non-zero if any placeholder is unresolved");

    decode->add_flag("-f,--force", gDecodeOpts.force, "Overwrite an existing output file");
}

void setupAnalyzeCommand(CLI::App& app) {
    auto* analyze = app.add_subcommand("analyze", "Report what encode would replace");
    analyze->alias("a");

    analyze->add_option("-i,--input", gAnalyzeOpts.input, "Input document")
        ->required()
        ->check(CLI::ExistingFile);

    analyze->add_option("--detector", gAnalyzeOpts.detectors, "Detector(s) to run")
        ->check(CLI::IsMember(detectorChoices()));

    analyze->add_option("--dictionary", gAnalyzeOpts.dictionary, "Dictionary file")
        ->check(CLI::ExistingFile);

    analyze->add_option("--spans", gAnalyzeOpts.spans, "Precomputed span file")
        ->check(CLI::ExistingFile);

    analyze->add_option("--priority", gAnalyzeOpts.priorities, "Override an overlap priority");

    analyze->add_option("--examples", gAnalyzeOpts.examples, "Examples shown per type")
        ->check(CLI::Range(0, 100));

    analyze->add_flag("--skip-masked", gAnalyzeOpts.skipMasked, "Ignore already masked values");
}

void setupInfoCommand(CLI::App& app) {
    auto* info = app.add_subcommand("info", "Display mapping file information");
    info->alias("i");

    info->add_option("-i,--input", gInfoOpts.input, "Input .dsm file")
        ->required()
        ->check(CLI::ExistingFile);

    info->add_flag("--json", gInfoOpts.json, "Output as JSON");

    info->add_flag("--show-values", gInfoOpts.showValues,
                   "Print the original values (sensitive)");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);
    app.set_config("--config", "", "Read options from a TOML/INI configuration file");

    // Global options
    app.add_option("-t,--threads", gOptions.threads, "Number of threads (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v, -vv for trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    setupEncodeCommand(app);
    setupDecodeCommand(app);
    setupAnalyzeCommand(app);
    setupInfoCommand(app);

    app.require_subcommand(1);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int cliCode = app.exit(e);
        return cliCode == 0 ? 0 : docsan::toExitCode(docsan::ErrorCode::kUsageError);
    }

    // Initialize logger
    const bool consoleLogging = !writesToStdout(app);
    try {
        docsan::log::Config config;
        config.logFile = gOptions.logFile;
        config.enableConsole = consoleLogging;
        config.level = docsan::log::Level::kInfo;
        if (gOptions.quiet) {
            config.level = docsan::log::Level::kError;
        } else if (gOptions.verbosity >= 2) {
            config.level = docsan::log::Level::kTrace;
        } else if (gOptions.verbosity >= 1) {
            config.level = docsan::log::Level::kDebug;
        }
        docsan::log::init(config);
    } catch (const std::exception& e) {
        fmt::print(stderr, "Failed to initialize logger: {}\n", e.what());
        return EXIT_FAILURE;
    }

    docsan::io::installSignalHandlers();

    int exitCode = 0;
    if (app.got_subcommand("encode")) {
        exitCode = docsan::commands::runEncode(app.get_subcommand("encode"));
    } else if (app.got_subcommand("decode")) {
        exitCode = docsan::commands::runDecode(app.get_subcommand("decode"));
    } else if (app.got_subcommand("analyze")) {
        exitCode = docsan::commands::runAnalyze(app.get_subcommand("analyze"));
    } else if (app.got_subcommand("info")) {
        exitCode = docsan::commands::runInfo(app.get_subcommand("info"));
    }

    docsan::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace docsan::commands {

namespace {

/// @brief Report a failed command and convert it to an exit code.
int reportFailure(std::string_view what, const DocsanException& e) {
    DOCSAN_LOG_ERROR("{} failed: {}", what, e.what());
    if (log::logger() == nullptr) {
        fmt::print(stderr, "docsan: {} failed: {}\n", what, e.what());
    }
    return toExitCode(e.code());
}

int reportUnexpected(const std::exception& e) {
    DOCSAN_LOG_ERROR("Unexpected error: {}", e.what());
    if (log::logger() == nullptr) {
        fmt::print(stderr, "docsan: unexpected error: {}\n", e.what());
    }
    return EXIT_FAILURE;
}

detect::DetectorOptions detectorOptions(const std::string& dictionary, const std::string& spans,
                                        bool skipMasked) {
    detect::DetectorOptions options;
    options.dictionaryPath = dictionary;
    options.spansPath = spans;
    options.pattern.skipMasked = skipMasked;
    return options;
}

}  // namespace

int runEncode([[maybe_unused]] CLI::App* app) {
    try {
        EncodeCommandOptions opts;
        for (const auto& input : gEncodeOpts.inputs) {
            opts.inputPaths.emplace_back(input);
        }
        opts.outputPath = gEncodeOpts.output;
        opts.outputDir = gEncodeOpts.outputDir;
        opts.mappingPath = gEncodeOpts.mapping;
        opts.detectors = gEncodeOpts.detectors;
        opts.detectorOptions =
            detectorOptions(gEncodeOpts.dictionary, gEncodeOpts.spans, gEncodeOpts.skipMasked);
        opts.encode.delimiters = {gEncodeOpts.openDelimiter, gEncodeOpts.closeDelimiter};
        opts.encode.priorities = buildPriorityTable(gEncodeOpts.priorities);
        opts.encode.sweepVariants = gEncodeOpts.sweep;
        opts.encode.minSweepLength = gEncodeOpts.minSweepLength;
        opts.encode.checkLeaks = gEncodeOpts.leakCheck;
        opts.encode.appendLegend = gEncodeOpts.legend;
        opts.threads = gOptions.threads;
        opts.dryRun = gEncodeOpts.dryRun;
        opts.showStats = gEncodeOpts.stats;
        opts.forceOverwrite = gEncodeOpts.force;

        EncodeCommand cmd(std::move(opts));
        return cmd.execute();
    } catch (const DocsanException& e) {
        return reportFailure("Encode", e);
    } catch (const std::exception& e) {
        return reportUnexpected(e);
    }
}

int runDecode([[maybe_unused]] CLI::App* app) {
    try {
        DecodeCommandOptions opts;
        opts.inputPath = gDecodeOpts.input;
        opts.mappingPath = gDecodeOpts.mapping;
        opts.outputPath = gDecodeOpts.output;
        opts.sourcePath = gDecodeOpts.source;
        opts.decode.stripLegend = gDecodeOpts.stripLegend;
        opts.failOnUnresolved = gDecodeOpts.failOnUnresolved;
        opts.forceOverwrite = gDecodeOpts.force;

        auto& tolerance = opts.decode.tolerance;
        if (gDecodeOpts.strict) {
            tolerance = algo::TolerancePolicy::strict();
        } else {
            tolerance.maxInnerWhitespace = gDecodeOpts.maxInnerWhitespace;
        }
        tolerance.matchBareTokens = gDecodeOpts.bareTokens;
        tolerance.acceptZeroPaddedIndex = gDecodeOpts.zeroPadded;

        DecodeCommand cmd(std::move(opts));
        return cmd.execute();
    } catch (const DocsanException& e) {
        return reportFailure("Decode", e);
    } catch (const std::exception& e) {
        return reportUnexpected(e);
    }
}

int runAnalyze([[maybe_unused]] CLI::App* app) {
    try {
        AnalyzeOptions opts;
        opts.inputPath = gAnalyzeOpts.input;
        opts.detectors = gAnalyzeOpts.detectors;
        opts.detectorOptions =
            detectorOptions(gAnalyzeOpts.dictionary, gAnalyzeOpts.spans, gAnalyzeOpts.skipMasked);
        opts.priorities = buildPriorityTable(gAnalyzeOpts.priorities);
        opts.maxExamples = gAnalyzeOpts.examples;

        AnalyzeCommand cmd(std::move(opts));
        return cmd.execute();
    } catch (const DocsanException& e) {
        return reportFailure("Analyze", e);
    } catch (const std::exception& e) {
        return reportUnexpected(e);
    }
}

int runInfo([[maybe_unused]] CLI::App* app) {
    try {
        InfoOptions opts;
        opts.inputPath = gInfoOpts.input;
        opts.jsonOutput = gInfoOpts.json;
        opts.showValues = gInfoOpts.showValues;

        InfoCommand cmd(std::move(opts));
        return cmd.execute();
    } catch (const DocsanException& e) {
        return reportFailure("Info", e);
    } catch (const std::exception& e) {
        return reportUnexpected(e);
    }
}

}  // namespace docsan::commands
