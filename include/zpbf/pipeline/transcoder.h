// =============================================================================
// zstd-pbf - Stream Transcoder
// =============================================================================
// Drives the frame loop: read frame -> decode blob -> recompress -> write frame.
//
// Frames are processed strictly in arrival order, one output frame per input
// frame, holding a single frame in memory at a time. The first error stops the
// run: the writer is aborted (its temporary file removed) and the error is
// rethrown with the input frame context attached.
//
// State transitions:
//   kRunning --(end of stream)--> kDraining --(output published)--> kDone
//   kRunning/kDraining --(any error)--> kFailed
// =============================================================================

#ifndef ZPBF_PIPELINE_TRANSCODER_H
#define ZPBF_PIPELINE_TRANSCODER_H

#include <cstdint>
#include <string_view>

#include "zpbf/codec/recompressor.h"
#include "zpbf/common/types.h"
#include "zpbf/format/pbf_reader.h"
#include "zpbf/format/pbf_writer.h"

namespace zpbf::pipeline {

// =============================================================================
// Transcoder State
// =============================================================================

/// @brief Lifecycle of one transcoding run.
enum class TranscodeState : std::uint8_t {
    /// @brief Frames are being read and written
    kRunning = 0,

    /// @brief End of input reached, output is being published
    kDraining = 1,

    /// @brief Run stopped on an error; no output was published
    kFailed = 2,

    /// @brief Output published under its final name
    kDone = 3
};

/// @brief Get the display name of a state.
[[nodiscard]] std::string_view transcodeStateName(TranscodeState state) noexcept;

// =============================================================================
// Transcode Statistics
// =============================================================================

/// @brief Statistics for a completed run.
struct TranscodeStats {
    /// @brief Frames transcoded
    FrameIndex frames = 0;

    /// @brief Frames whose source blob was stored raw
    FrameIndex rawFrames = 0;

    /// @brief Frames whose source blob was zlib-compressed
    FrameIndex zlibFrames = 0;

    /// @brief Bytes consumed from the input file
    std::uint64_t inputBytes = 0;

    /// @brief Bytes written to the output file
    std::uint64_t outputBytes = 0;

    /// @brief Uncompressed payload bytes across all frames
    std::uint64_t rawBytes = 0;

    /// @brief Processing time (milliseconds)
    std::uint64_t processingTimeMs = 0;

    /// @brief Output size relative to input size
    [[nodiscard]] double compressionRatio() const noexcept {
        if (inputBytes == 0) return 1.0;
        return static_cast<double>(outputBytes) / static_cast<double>(inputBytes);
    }

    /// @brief Get throughput over uncompressed payload (MB/s)
    [[nodiscard]] double throughputMBps() const noexcept {
        if (processingTimeMs == 0) return 0.0;
        return (static_cast<double>(rawBytes) / (1024.0 * 1024.0)) /
               (static_cast<double>(processingTimeMs) / 1000.0);
    }
};

// =============================================================================
// Transcoder Class
// =============================================================================

/// @brief Rewrites every blob of a PBF stream as zstd.
class Transcoder {
public:
    /// @brief Create a transcoder for the given preset.
    /// @throws CodecError if the zstd context cannot be created.
    explicit Transcoder(CompressionLevel level);

    /// @brief Transcode every frame from reader into writer and publish.
    /// @return Statistics for the run.
    /// @throws ZpbfException on the first failure, after aborting the writer.
    TranscodeStats run(format::PbfReader& reader, format::PbfWriter& writer);

    [[nodiscard]] TranscodeState state() const noexcept { return state_; }

    [[nodiscard]] CompressionLevel level() const noexcept { return recompressor_.level(); }

private:
    void setState(TranscodeState state);

    codec::Recompressor recompressor_;
    TranscodeState state_ = TranscodeState::kRunning;
};

}  // namespace zpbf::pipeline

#endif  // ZPBF_PIPELINE_TRANSCODER_H
