// =============================================================================
// zstd-pbf - OSM PBF zstd Transcoder
// =============================================================================
// Main entry point for the zstd-pbf command-line tool.
//
// Parses the command line, starts logging and runs the transcode command.
// The process exit code is the ErrorCode of the first failure.
// =============================================================================

#include <cstdlib>
#include <iostream>

#include "zpbf/common/error.h"
#include "zpbf/common/logger.h"

#include "cli/command_line.h"
#include "commands/transcode_command.h"

int main(int argc, char* argv[]) {
    zpbf::cli::CommandLine commandLine;
    if (auto exitCode = commandLine.parse(argc, argv)) {
        return *exitCode;
    }
    const auto& options = commandLine.options();

    try {
        zpbf::log::Config config;
        config.logFile = options.logFile;
        config.level = commandLine.logLevel();
        zpbf::log::init(config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return zpbf::toExitCode(zpbf::ErrorCode::kIOError);
    }

    int exitCode = EXIT_SUCCESS;
    try {
        auto cmd = zpbf::commands::createTranscodeCommand(options.input, options.output,
                                                          options.level, options.summary);
        exitCode = cmd->execute();
    } catch (const zpbf::ZpbfException& ex) {
        ZPBF_LOG_ERROR("Error: {}", ex.what());
        std::cerr << "zstd-pbf: " << ex.what() << std::endl;
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        ZPBF_LOG_ERROR("Unexpected error: {}", ex.what());
        std::cerr << "zstd-pbf: " << ex.what() << std::endl;
        exitCode = EXIT_FAILURE;
    }

    zpbf::log::shutdown();
    return exitCode;
}
