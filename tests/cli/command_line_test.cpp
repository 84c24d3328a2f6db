// =============================================================================
// zstd-pbf - Command Line Tests
// =============================================================================
// Tests for preset selection, mutually exclusive flags and the exit codes of
// parse errors.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include "cli/command_line.h"

namespace zpbf::cli::test {

namespace {

/// @brief Parse a command line given without the program name.
std::optional<int> parseArgs(CommandLine& commandLine, std::vector<std::string> args) {
    args.insert(args.begin(), "zstd-pbf");
    std::vector<const char*> argv;
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    return commandLine.parse(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST(CommandLineTest, PositionalsWithoutPresetSelectDefault) {
    CommandLine commandLine;
    EXPECT_EQ(parseArgs(commandLine, {"in.osm.pbf", "out.osm.pbf"}), std::nullopt);

    const auto& options = commandLine.options();
    EXPECT_EQ(options.input, "in.osm.pbf");
    EXPECT_EQ(options.output, "out.osm.pbf");
    EXPECT_EQ(options.level, CompressionLevel::kDefault);
    EXPECT_FALSE(options.summary);
    EXPECT_TRUE(options.logFile.empty());
    EXPECT_EQ(commandLine.logLevel(), log::Level::kInfo);
}

TEST(CommandLineTest, PresetFlagSelectsLevel) {
    struct Case {
        const char* flag;
        CompressionLevel level;
    };
    for (const Case& c : {Case{"--fastest", CompressionLevel::kFastest},
                          Case{"--default", CompressionLevel::kDefault},
                          Case{"--better", CompressionLevel::kBetter},
                          Case{"--best", CompressionLevel::kBest}}) {
        SCOPED_TRACE(c.flag);
        CommandLine commandLine;
        EXPECT_EQ(parseArgs(commandLine, {c.flag, "in", "out"}), std::nullopt);
        EXPECT_EQ(commandLine.options().level, c.level);
    }
}

TEST(CommandLineTest, ConflictingPresetsAreUsageError) {
    CommandLine commandLine;
    EXPECT_EQ(parseArgs(commandLine, {"--fastest", "--best", "a", "b"}), 1);
}

TEST(CommandLineTest, MissingOutputIsUsageError) {
    CommandLine commandLine;
    EXPECT_EQ(parseArgs(commandLine, {"onlyone"}), 1);
}

TEST(CommandLineTest, NoArgumentsIsUsageError) {
    CommandLine commandLine;
    EXPECT_EQ(parseArgs(commandLine, {}), 1);
}

TEST(CommandLineTest, ExtraPositionalIsUsageError) {
    CommandLine commandLine;
    EXPECT_EQ(parseArgs(commandLine, {"a", "b", "c"}), 1);
}

TEST(CommandLineTest, UnknownOptionIsUsageError) {
    CommandLine commandLine;
    EXPECT_EQ(parseArgs(commandLine, {"--ultra", "a", "b"}), 1);
}

TEST(CommandLineTest, HelpAndVersionExitZero) {
    CommandLine help;
    EXPECT_EQ(parseArgs(help, {"--help"}), 0);

    CommandLine version;
    EXPECT_EQ(parseArgs(version, {"--version"}), 0);
}

TEST(CommandLineTest, VerbosityFlags) {
    CommandLine debug;
    ASSERT_EQ(parseArgs(debug, {"-v", "a", "b"}), std::nullopt);
    EXPECT_EQ(debug.logLevel(), log::Level::kDebug);

    CommandLine trace;
    ASSERT_EQ(parseArgs(trace, {"-vv", "a", "b"}), std::nullopt);
    EXPECT_EQ(trace.logLevel(), log::Level::kTrace);

    CommandLine quiet;
    ASSERT_EQ(parseArgs(quiet, {"--quiet", "a", "b"}), std::nullopt);
    EXPECT_EQ(quiet.logLevel(), log::Level::kError);
}

TEST(CommandLineTest, VerboseAndQuietAreUsageError) {
    CommandLine commandLine;
    EXPECT_EQ(parseArgs(commandLine, {"-v", "-q", "a", "b"}), 1);
}

TEST(CommandLineTest, LogFileAndSummary) {
    CommandLine commandLine;
    ASSERT_EQ(parseArgs(commandLine, {"--summary", "--log-file", "run.log", "--better", "a", "b"}),
              std::nullopt);
    EXPECT_TRUE(commandLine.options().summary);
    EXPECT_EQ(commandLine.options().logFile, "run.log");
    EXPECT_EQ(commandLine.options().level, CompressionLevel::kBetter);
}

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(CommandLineProperty, AnyTwoDistinctPresetsConflict, ()) {
    const std::vector<std::string> presets = {"--fastest", "--default", "--better", "--best"};
    auto first = *rc::gen::inRange<std::size_t>(0, presets.size());
    auto second = *rc::gen::distinctFrom(rc::gen::inRange<std::size_t>(0, presets.size()), first);
    auto presetsFirst = *rc::gen::arbitrary<bool>();

    std::vector<std::string> args = {presets[first], presets[second]};
    if (presetsFirst) {
        args.insert(args.end(), {"in", "out"});
    } else {
        args.insert(args.begin(), {"in", "out"});
    }

    CommandLine commandLine;
    RC_ASSERT(parseArgs(commandLine, args) == std::optional<int>(1));
}

}  // namespace zpbf::cli::test
