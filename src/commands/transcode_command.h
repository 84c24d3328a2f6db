// =============================================================================
// zstd-pbf - Transcode Command
// =============================================================================
// Command handler for rewriting an OSM PBF file with zstd-compressed blobs.
//
// This module provides:
// - TranscodeOptions: Configuration for one run
// - TranscodeCommand: Validates paths, runs the Transcoder, reports results
// =============================================================================

#ifndef ZPBF_COMMANDS_TRANSCODE_COMMAND_H
#define ZPBF_COMMANDS_TRANSCODE_COMMAND_H

#include <filesystem>
#include <memory>
#include <string>

#include "zpbf/common/error.h"
#include "zpbf/common/types.h"
#include "zpbf/pipeline/transcoder.h"

namespace zpbf::commands {

// =============================================================================
// Transcode Options
// =============================================================================

/// @brief Configuration options for the transcode command.
struct TranscodeOptions {
    /// @brief Input PBF file path.
    std::filesystem::path inputPath;

    /// @brief Output PBF file path (must not exist).
    std::filesystem::path outputPath;

    /// @brief zstd preset applied to every blob.
    CompressionLevel level = CompressionLevel::kDefault;

    /// @brief Print run statistics to stdout on success.
    bool showSummary = false;
};

// =============================================================================
// TranscodeCommand Class
// =============================================================================

/// @brief Command handler for PBF transcoding.
class TranscodeCommand {
public:
    /// @brief Construct with options.
    explicit TranscodeCommand(TranscodeOptions options);

    /// @brief Destructor.
    ~TranscodeCommand();

    // Non-copyable, movable
    TranscodeCommand(const TranscodeCommand&) = delete;
    TranscodeCommand& operator=(const TranscodeCommand&) = delete;
    TranscodeCommand(TranscodeCommand&&) noexcept;
    TranscodeCommand& operator=(TranscodeCommand&&) noexcept;

    /// @brief Execute the transcode command.
    /// @return Exit code (0 = success, otherwise the ErrorCode of the failure).
    [[nodiscard]] int execute();

    /// @brief Get the options.
    [[nodiscard]] const TranscodeOptions& options() const noexcept { return options_; }

    /// @brief Get statistics of the last successful run.
    [[nodiscard]] const pipeline::TranscodeStats& stats() const noexcept { return stats_; }

private:
    /// @brief Validate paths before any stream is opened.
    /// @throws IOError if the input does not exist.
    /// @throws UsageError if the output already exists.
    void validateOptions() const;

    /// @brief Print the run summary to stdout.
    void printSummary() const;

    TranscodeOptions options_;
    pipeline::TranscodeStats stats_;
};

// =============================================================================
// Factory Function
// =============================================================================

/// @brief Create a transcode command from CLI options.
[[nodiscard]] std::unique_ptr<TranscodeCommand> createTranscodeCommand(
    const std::string& inputPath,
    const std::string& outputPath,
    CompressionLevel level,
    bool showSummary);

}  // namespace zpbf::commands

#endif  // ZPBF_COMMANDS_TRANSCODE_COMMAND_H
