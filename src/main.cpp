// =============================================================================
// blkstore - Content-Addressed Block Store Client
// =============================================================================
// Main entry point for the blkstore command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: put, fetch, verify
// - Global options: store root, backoff schedule, parallelism, verbosity,
//   log file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "blkstore/common/error.h"
#include "blkstore/common/logger.h"
#include "blkstore/common/types.h"
#include "blkstore/retrieval/backoff.h"
#include "blkstore/retrieval/retrieval_config.h"

#include "commands/fetch_command.h"
#include "commands/put_command.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "blkstore: content-addressed block store client\n"
    "Stores files as compressed, checksummed blocks and retrieves them with\n"
    "retries on a backoff schedule and automatic codec fallback.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string root = ".";
    std::string backoff;           // empty = reference schedule
    std::size_t parallelism = 0;   // 0 = auto-detect
    int verbosity = 0;             // 0 = normal, 1 = verbose, 2 = trace
    bool quiet = false;
    std::string logLevel;          // overrides -v/-q when set
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Subcommand Options
// =============================================================================

struct CliPutOptions {
    std::string input;
    std::string volume;
    std::string codec = "gzip";
    std::optional<int> level;
    std::string blockSize;
};

CliPutOptions gPutOpts;

struct CliFetchOptions {
    std::vector<std::string> checksums;
    std::string volume;
    std::string codec = "gzip";
    std::string output;
    bool failFast = false;
};

CliFetchOptions gFetchOpts;
CliFetchOptions gVerifyOpts;

const std::vector<std::string> kCodecNames = {"none", "gzip", "zstd"};

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupPutCommand(CLI::App& app) {
    auto* put = app.add_subcommand("put", "Store a file as compressed blocks");
    put->alias("p");

    put->add_option("input", gPutOpts.input, "File to store")
        ->required()
        ->check(CLI::ExistingFile);

    put->add_option("--volume", gPutOpts.volume, "Volume name")->required();

    put->add_option("-c,--codec", gPutOpts.codec, "Block codec: none, gzip, zstd")
        ->default_val("gzip")
        ->check(CLI::IsMember(kCodecNames));

    put->add_option("-l,--level", gPutOpts.level, "Compression level (codec specific)");

    put->add_option("--block-size", gPutOpts.blockSize,
                    "Block size quantity, e.g. 2Mi or 512Ki (default 2Mi)");
}

void addRetrievalOptions(CLI::App& command, CliFetchOptions& opts) {
    command.add_option("checksums", opts.checksums, "Checksums of the blocks")
        ->required()
        ->expected(1, -1);

    command.add_option("--volume", opts.volume, "Volume name")->required();

    command.add_option("-c,--codec", opts.codec, "Codec the blocks were stored with")
        ->default_val("gzip")
        ->check(CLI::IsMember(kCodecNames));

    command.add_flag("--fail-fast", opts.failFast, "Cancel remaining blocks on first error");
}

void setupFetchCommand(CLI::App& app) {
    auto* fetch = app.add_subcommand("fetch", "Fetch blocks and write their content");
    fetch->alias("f");
    addRetrievalOptions(*fetch, gFetchOpts);
    fetch->add_option("-o,--output", gFetchOpts.output, "Output directory")->required();
}

void setupVerifyCommand(CLI::App& app) {
    auto* verify = app.add_subcommand("verify", "Fetch and verify blocks without writing them");
    verify->alias("v");
    addRetrievalOptions(*verify, gVerifyOpts);
}

// =============================================================================
// Configuration
// =============================================================================

/// @brief Build the shared configuration from global options.
/// @throws UsageError if the backoff schedule does not parse.
blkstore::retrieval::RetrievalConfig buildConfig() {
    blkstore::retrieval::RetrievalConfig config;
    config.root = gOptions.root;
    config.maxParallelFetches = gOptions.parallelism;
    config.logFile = gOptions.logFile;
    config.logLevel = gOptions.logLevel.empty()
                          ? blkstore::log::levelFromVerbosity(gOptions.verbosity, gOptions.quiet)
                          : blkstore::log::levelFromString(gOptions.logLevel);

    if (!gOptions.backoff.empty()) {
        auto schedule = blkstore::retrieval::BackoffSchedule::parse(gOptions.backoff);
        if (!schedule) {
            throw blkstore::UsageError(
                schedule.error().wrap("invalid --backoff").message());
        }
        config.schedule = std::move(*schedule);
    }
    return config;
}

blkstore::Codec parseCodecName(const std::string& name) {
    const auto codec = blkstore::codecFromString(name);
    if (!codec) {
        throw blkstore::UnsupportedCodecError("unknown codec: " + name);
    }
    return *codec;
}

// =============================================================================
// Command Dispatch
// =============================================================================

int runPut(const blkstore::retrieval::RetrievalConfig& config) {
    blkstore::commands::PutOptions opts;
    opts.inputPath = gPutOpts.input;
    opts.volume = gPutOpts.volume;
    opts.codec = parseCodecName(gPutOpts.codec);
    opts.level = gPutOpts.level;
    opts.blockSize = gPutOpts.blockSize;
    opts.config = config;

    blkstore::commands::PutCommand cmd(std::move(opts));
    return cmd.execute(std::cout);
}

int runFetch(const blkstore::retrieval::RetrievalConfig& config, const CliFetchOptions& cli,
             const std::string& outputDir) {
    blkstore::commands::FetchOptions opts;
    opts.checksums.assign(cli.checksums.begin(), cli.checksums.end());
    opts.volume = cli.volume;
    opts.codec = parseCodecName(cli.codec);
    opts.outputDir = outputDir;
    opts.failFast = cli.failFast;
    opts.config = config;

    blkstore::commands::FetchCommand cmd(std::move(opts));
    return cmd.execute(std::cout);
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_option("-r,--root", gOptions.root, "Block store root directory")->default_val(".");

    app.add_option("--backoff", gOptions.backoff,
                   "Comma-separated retry waits, e.g. 1s,5s,30s,2m (default: 1s..6h, 'none' "
                   "disables retries)");

    app.add_option("-j,--parallel", gOptions.parallelism,
                   "Concurrent block fetches (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v, -vv for trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-level", gOptions.logLevel,
                   "Log level: trace, debug, info, warning, error, critical");

    app.add_option("--log-file", gOptions.logFile, "Write logs to this file");

    setupPutCommand(app);
    setupFetchCommand(app);
    setupVerifyCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    blkstore::retrieval::RetrievalConfig config;
    try {
        config = buildConfig();
    } catch (const blkstore::BlkstoreException& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return ex.exitCode();
    }

    // Initialize logger
    try {
        blkstore::log::Config logConfig;
        logConfig.logFile = config.logFile;
        logConfig.level = config.logLevel;
        blkstore::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("put")) {
            exitCode = runPut(config);
        } else if (app.got_subcommand("fetch")) {
            exitCode = runFetch(config, gFetchOpts, gFetchOpts.output);
        } else if (app.got_subcommand("verify")) {
            exitCode = runFetch(config, gVerifyOpts, "");
        }
    } catch (const blkstore::BlkstoreException& ex) {
        BLKSTORE_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        BLKSTORE_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    blkstore::log::shutdown();
    return exitCode;
}
