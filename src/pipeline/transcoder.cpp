// =============================================================================
// zstd-pbf - Stream Transcoder Implementation
// =============================================================================

#include "zpbf/pipeline/transcoder.h"

#include <chrono>

#include "zpbf/common/logger.h"

namespace zpbf::pipeline {

std::string_view transcodeStateName(TranscodeState state) noexcept {
    switch (state) {
        case TranscodeState::kRunning:
            return "running";
        case TranscodeState::kDraining:
            return "draining";
        case TranscodeState::kFailed:
            return "failed";
        case TranscodeState::kDone:
            return "done";
    }
    return "unknown";
}

// =============================================================================
// Transcoder Implementation
// =============================================================================

Transcoder::Transcoder(CompressionLevel level) : recompressor_(level) {}

TranscodeStats Transcoder::run(format::PbfReader& reader, format::PbfWriter& writer) {
    setState(TranscodeState::kRunning);
    TranscodeStats stats;
    auto startTime = std::chrono::steady_clock::now();

    ZPBF_LOG_INFO("Transcoding {} -> {} (level={})", reader.sourceName(),
                  writer.outputPath().string(), compressionLevelName(level()));

    try {
        while (auto frame = reader.readFrame()) {
            const auto variant = format::blobVariant(frame->blob);
            const auto inputSize = frame->header.datasize();

            std::string blobBytes;
            try {
                blobBytes = recompressor_.transcode(*frame);
                writer.writeFrame(frame->header, blobBytes);
            } catch (ZpbfException& e) {
                // The reader has already moved past this frame
                e.attachContext(ErrorContext(reader.sourceName())
                                    .withFrame(stats.frames)
                                    .withOffset(reader.frameOffset()));
                throw;
            }

            ++stats.frames;
            if (variant == format::BlobVariant::kRaw) {
                ++stats.rawFrames;
            } else {
                ++stats.zlibFrames;
            }
            stats.rawBytes += static_cast<std::uint64_t>(frame->blob.raw_size());

            ZPBF_LOG_DEBUG("Frame {}: type={}, {} {} -> zstd {} bytes", stats.frames - 1,
                           frame->header.type(), format::blobVariantName(variant), inputSize,
                           blobBytes.size());
        }

        setState(TranscodeState::kDraining);
        writer.finalize();
    } catch (ZpbfException& e) {
        setState(TranscodeState::kFailed);
        e.attachContext(reader.frameContext());
        writer.abort();
        ZPBF_LOG_DEBUG("Transcoder failed after {} frames, output discarded", stats.frames);
        throw;
    } catch (...) {
        setState(TranscodeState::kFailed);
        writer.abort();
        throw;
    }

    setState(TranscodeState::kDone);

    auto endTime = std::chrono::steady_clock::now();
    stats.processingTimeMs = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count());
    stats.inputBytes = reader.bytesRead();
    stats.outputBytes = writer.bytesWritten();

    ZPBF_LOG_INFO("Transcoding complete: {} frames, {} -> {} bytes in {} ms", stats.frames,
                  stats.inputBytes, stats.outputBytes, stats.processingTimeMs);
    return stats;
}

void Transcoder::setState(TranscodeState state) {
    ZPBF_LOG_TRACE("Transcoder state: {} -> {}", transcodeStateName(state_),
                   transcodeStateName(state));
    state_ = state;
}

}  // namespace zpbf::pipeline
