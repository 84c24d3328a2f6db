// =============================================================================
// zstd-pbf - Transcode Command Implementation
// =============================================================================

#include "transcode_command.h"

#include <iomanip>
#include <iostream>

#include "zpbf/common/logger.h"
#include "zpbf/format/pbf_reader.h"
#include "zpbf/format/pbf_writer.h"

namespace zpbf::commands {

// =============================================================================
// TranscodeCommand Implementation
// =============================================================================

TranscodeCommand::TranscodeCommand(TranscodeOptions options) : options_(std::move(options)) {}

TranscodeCommand::~TranscodeCommand() = default;

TranscodeCommand::TranscodeCommand(TranscodeCommand&&) noexcept = default;
TranscodeCommand& TranscodeCommand::operator=(TranscodeCommand&&) noexcept = default;

int TranscodeCommand::execute() {
    try {
        validateOptions();

        format::PbfReader reader(options_.inputPath);
        format::PbfWriter writer(options_.outputPath);
        pipeline::Transcoder transcoder(options_.level);

        stats_ = transcoder.run(reader, writer);

        if (options_.showSummary) {
            printSummary();
        }

        return 0;

    } catch (const ZpbfException& e) {
        ZPBF_LOG_ERROR("Transcode failed: {}", e.what());
        std::cerr << "zstd-pbf: " << e.what() << std::endl;
        return e.exitCode();
    }
}

void TranscodeCommand::validateOptions() const {
    std::error_code ec;
    if (!std::filesystem::exists(options_.inputPath, ec)) {
        throw IOError("Could not open file '" + options_.inputPath.string() + "'",
                      ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory),
                      ErrorContext(options_.inputPath.string()));
    }

    if (std::filesystem::exists(options_.outputPath, ec)) {
        throw UsageError("The file '" + options_.outputPath.string() + "' already exists",
                         ErrorContext(options_.outputPath.string()));
    }

    ZPBF_LOG_DEBUG("Options validated: input={}, output={}, level={}",
                   options_.inputPath.string(), options_.outputPath.string(),
                   compressionLevelName(options_.level));
}

void TranscodeCommand::printSummary() const {
    std::cout << "\n=== Transcode Summary ===" << std::endl;
    std::cout << "  Level:            " << compressionLevelName(options_.level) << " (zstd "
              << toZstdLevel(options_.level) << ")" << std::endl;
    std::cout << "  Frames:           " << stats_.frames << " (raw " << stats_.rawFrames
              << ", zlib " << stats_.zlibFrames << ")" << std::endl;
    std::cout << "  Input size:       " << stats_.inputBytes << " bytes" << std::endl;
    std::cout << "  Output size:      " << stats_.outputBytes << " bytes" << std::endl;
    std::cout << "  Payload size:     " << stats_.rawBytes << " bytes" << std::endl;
    std::cout << "  Size ratio:       " << std::fixed << std::setprecision(3)
              << stats_.compressionRatio() << std::endl;
    std::cout << "  Elapsed time:     " << stats_.processingTimeMs << " ms" << std::endl;
    std::cout << "  Throughput:       " << std::fixed << std::setprecision(2)
              << stats_.throughputMBps() << " MB/s" << std::endl;
    std::cout << "=========================" << std::endl;
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<TranscodeCommand> createTranscodeCommand(const std::string& inputPath,
                                                         const std::string& outputPath,
                                                         CompressionLevel level,
                                                         bool showSummary) {
    TranscodeOptions opts;
    opts.inputPath = inputPath;
    opts.outputPath = outputPath;
    opts.level = level;
    opts.showSummary = showSummary;
    return std::make_unique<TranscodeCommand>(std::move(opts));
}

}  // namespace zpbf::commands
