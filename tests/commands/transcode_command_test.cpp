// =============================================================================
// zstd-pbf - Transcode Command Tests
// =============================================================================
// File-level tests of path validation, exit codes and the run summary.
// =============================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

#include "commands/transcode_command.h"
#include "support/pbf_test_utils.h"

namespace zpbf::commands::test {

using zpbf::test::decodeFrames;
using zpbf::test::encodeFrame;
using zpbf::test::makeRawBlob;
using zpbf::test::makeZlibBlob;
using zpbf::test::readFile;
using zpbf::test::TempFileGuard;
using zpbf::test::tempFilePath;
using zpbf::test::writeFile;
using zpbf::test::zstdDecompress;

namespace {

/// @brief Redirect a stream into a buffer for the lifetime of the guard.
class StreamCapture {
public:
    explicit StreamCapture(std::ostream& stream) : stream_(stream), old_(stream.rdbuf()) {
        stream_.rdbuf(buffer_.rdbuf());
    }
    ~StreamCapture() { stream_.rdbuf(old_); }
    StreamCapture(const StreamCapture&) = delete;
    StreamCapture& operator=(const StreamCapture&) = delete;

    [[nodiscard]] std::string str() const { return buffer_.str(); }

private:
    std::ostream& stream_;
    std::streambuf* old_;
    std::ostringstream buffer_;
};

}  // namespace

class TranscodeCommandTest : public ::testing::Test {
protected:
    TempFileGuard input_{tempFilePath(".in.osm.pbf")};
    TempFileGuard output_{tempFilePath(".out.osm.pbf")};
};

TEST_F(TranscodeCommandTest, TranscodesFile) {
    writeFile(input_.path(), encodeFrame("OSMHeader", makeRawBlob("header")) +
                                 encodeFrame("OSMData", makeZlibBlob("hello world")));

    auto cmd = createTranscodeCommand(input_.path().string(), output_.path().string(),
                                      CompressionLevel::kBetter, false);
    EXPECT_EQ(cmd->execute(), 0);
    EXPECT_EQ(cmd->stats().frames, 2u);

    auto frames = decodeFrames(readFile(output_.path()));
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(zstdDecompress(frames[0].blob.zstd_data()), "header");
    EXPECT_EQ(zstdDecompress(frames[1].blob.zstd_data()), "hello world");
}

TEST_F(TranscodeCommandTest, SummaryGoesToStdout) {
    writeFile(input_.path(), encodeFrame("OSMData", makeZlibBlob("hello world")));

    TranscodeOptions options;
    options.inputPath = input_.path();
    options.outputPath = output_.path();
    options.showSummary = true;
    TranscodeCommand cmd(options);

    StreamCapture capture(std::cout);
    ASSERT_EQ(cmd.execute(), 0);
    std::string summary = capture.str();
    EXPECT_NE(summary.find("Transcode Summary"), std::string::npos);
    EXPECT_NE(summary.find("default (zstd 3)"), std::string::npos);
}

TEST_F(TranscodeCommandTest, MissingInputIsIOError) {
    auto cmd = createTranscodeCommand(input_.path().string(), output_.path().string(),
                                      CompressionLevel::kDefault, false);
    StreamCapture capture(std::cerr);
    EXPECT_EQ(cmd->execute(), toExitCode(ErrorCode::kIOError));
    EXPECT_NE(capture.str().find(input_.path().string()), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(output_.path()));
}

TEST_F(TranscodeCommandTest, ExistingOutputIsUsageError) {
    writeFile(input_.path(), encodeFrame("OSMData", makeZlibBlob("hello world")));
    writeFile(output_.path(), "existing");

    auto cmd = createTranscodeCommand(input_.path().string(), output_.path().string(),
                                      CompressionLevel::kDefault, false);
    StreamCapture capture(std::cerr);
    EXPECT_EQ(cmd->execute(), toExitCode(ErrorCode::kUsageError));
    EXPECT_NE(capture.str().find("already exists"), std::string::npos);
    EXPECT_EQ(readFile(output_.path()), "existing");
}

TEST_F(TranscodeCommandTest, CorruptInputIsFormatErrorWithoutOutput) {
    std::string frame = encodeFrame("OSMData", makeZlibBlob("hello world"));
    writeFile(input_.path(), frame + frame.substr(0, frame.size() - 1));

    auto cmd = createTranscodeCommand(input_.path().string(), output_.path().string(),
                                      CompressionLevel::kDefault, false);
    StreamCapture capture(std::cerr);
    EXPECT_EQ(cmd->execute(), toExitCode(ErrorCode::kFormatError));
    EXPECT_FALSE(std::filesystem::exists(output_.path()));
    EXPECT_FALSE(std::filesystem::exists(output_.path().string() + ".tmp"));
}

TEST_F(TranscodeCommandTest, UnsupportedBlobExitCode) {
    OSMPBF::Blob blob;
    blob.set_lzma_data("lzma");
    blob.set_raw_size(10);
    writeFile(input_.path(), encodeFrame("OSMData", blob));

    auto cmd = createTranscodeCommand(input_.path().string(), output_.path().string(),
                                      CompressionLevel::kDefault, false);
    StreamCapture capture(std::cerr);
    EXPECT_EQ(cmd->execute(), toExitCode(ErrorCode::kUnsupportedCodec));
    EXPECT_NE(capture.str().find("lzma"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(output_.path()));
}

}  // namespace zpbf::commands::test
