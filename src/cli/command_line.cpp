// =============================================================================
// zstd-pbf - Command Line Implementation
// =============================================================================

#include "cli/command_line.h"

#include <array>

#include "zpbf/common/error.h"

namespace zpbf::cli {

namespace {

constexpr const char* kDescription =
    "zstd-pbf: Rewrite an OpenStreetMap PBF file with zstd-compressed blobs\n"
    "Every raw or zlib blob of IN_FILE is recompressed with zstd and written,\n"
    "in order, to OUT_FILE. OUT_FILE must not exist and is only created once\n"
    "the whole input has been transcoded.";

struct PresetFlag {
    std::string_view name;
    const char* help;
};

constexpr std::array<PresetFlag, 4> kPresetFlags = {{
    {"fastest", "Fastest zstd compression (level 1)"},
    {"default", "Default zstd compression (level 3)"},
    {"better", "Better zstd compression (level 7)"},
    {"best", "Best zstd compression (level 11)"},
}};

}  // namespace

CommandLine::CommandLine() : app_(kDescription, "zstd-pbf") {
    app_.set_version_flag("-V,--version", kVersion);
    setupOptions();
}

void CommandLine::setupOptions() {
    app_.add_option("IN_FILE", options_.input, "Input OSM PBF file")->required();
    app_.add_option("OUT_FILE", options_.output, "Output OSM PBF file (must not exist)")
        ->required();

    for (const auto& preset : kPresetFlags) {
        auto* flag = app_.add_flag("--" + std::string(preset.name), preset.help);
        for (const auto& earlier : presetFlags_) {
            flag->excludes(earlier.second);
        }
        presetFlags_.emplace_back(preset.name, flag);
    }

    auto* verbose = app_.add_flag("-v,--verbose", options_.verbosity,
                                  "Increase verbosity (-v debug, -vv trace)");
    auto* quiet = app_.add_flag("-q,--quiet", options_.quiet, "Only log errors");
    verbose->excludes(quiet);

    app_.add_option("--log-file", options_.logFile, "Also write the log to this file");

    app_.add_flag("--summary", options_.summary, "Print run statistics on success");
}

std::optional<int> CommandLine::parse(int argc, const char* const* argv) {
    try {
        app_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // --help and --version exit 0, every real parse error is a usage error
        int code = app_.exit(e);
        return code == 0 ? 0 : toExitCode(ErrorCode::kUsageError);
    }

    resolvePreset();
    return std::nullopt;
}

void CommandLine::resolvePreset() {
    options_.level = CompressionLevel::kDefault;
    for (const auto& [name, flag] : presetFlags_) {
        if (flag->count() > 0) {
            options_.level = compressionLevelFromString(name).value_or(CompressionLevel::kDefault);
        }
    }
}

log::Level CommandLine::logLevel() const noexcept {
    return log::levelForVerbosity(options_.verbosity, options_.quiet);
}

}  // namespace zpbf::cli
