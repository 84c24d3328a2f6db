// =============================================================================
// zstd-pbf - Command Line
// =============================================================================
// CLI11 definition of the zstd-pbf command line.
//
// This module provides:
// - CliOptions: Values collected from the command line
// - CommandLine: Option setup, preset resolution and parse-error exit codes
//
// Usage:
//   zpbf::cli::CommandLine commandLine;
//   if (auto exitCode = commandLine.parse(argc, argv)) {
//       return *exitCode;  // --help, --version or a usage error
//   }
// =============================================================================

#ifndef ZPBF_CLI_COMMAND_LINE_H
#define ZPBF_CLI_COMMAND_LINE_H

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <CLI/CLI.hpp>

#include "zpbf/common/logger.h"
#include "zpbf/common/types.h"

namespace zpbf::cli {

/// @brief Program version reported by --version.
inline constexpr const char* kVersion = "0.1.0";

/// @brief Values collected from the command line.
struct CliOptions {
    std::string input;
    std::string output;

    /// @brief Selected preset; kDefault when no preset flag is given.
    CompressionLevel level = CompressionLevel::kDefault;

    /// @brief Number of -v flags.
    int verbosity = 0;

    bool quiet = false;
    std::string logFile;
    bool summary = false;
};

/// @brief The zstd-pbf command line.
/// @note The preset flags --fastest, --default, --better and --best exclude
///       each other, as do -v and -q.
class CommandLine {
public:
    CommandLine();

    // Options are bound to members of this object
    CommandLine(const CommandLine&) = delete;
    CommandLine& operator=(const CommandLine&) = delete;

    /// @brief Parse the arguments.
    /// @return std::nullopt if the run should go ahead. Otherwise the exit
    ///         code: 0 after --help or --version, 1 for any parse error.
    /// @note CLI11 prints help, version and error text itself.
    [[nodiscard]] std::optional<int> parse(int argc, const char* const* argv);

    [[nodiscard]] const CliOptions& options() const noexcept { return options_; }

    /// @brief Log level selected by -v/-q.
    [[nodiscard]] log::Level logLevel() const noexcept;

private:
    void setupOptions();

    /// @brief Set options_.level from the preset flag that was given.
    void resolvePreset();

    CLI::App app_;
    CliOptions options_;
    std::vector<std::pair<std::string_view, CLI::Option*>> presetFlags_;
};

}  // namespace zpbf::cli

#endif  // ZPBF_CLI_COMMAND_LINE_H
