// =============================================================================
// zstd-pbf - Zstd Recompressor
// =============================================================================
// Re-encodes raw Blob payloads as zstd frames and rewraps them.
//
// The compression level is fixed at construction; one Recompressor is created
// per run and reused for every frame.
// =============================================================================

#ifndef ZPBF_CODEC_RECOMPRESSOR_H
#define ZPBF_CODEC_RECOMPRESSOR_H

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "zpbf/common/error.h"
#include "zpbf/common/types.h"
#include "zpbf/format/pbf_format.h"

namespace zpbf::codec {

/// @brief Zstd encoder bound to one CompressionLevel.
class Recompressor {
public:
    /// @brief Create an encoder for the given preset.
    /// @throws CodecError if the zstd context cannot be created or configured.
    explicit Recompressor(CompressionLevel level);

    ~Recompressor();

    Recompressor(const Recompressor&) = delete;
    Recompressor& operator=(const Recompressor&) = delete;
    Recompressor(Recompressor&&) noexcept;
    Recompressor& operator=(Recompressor&&) noexcept;

    /// @brief Compress raw bytes into a single finished zstd frame.
    /// @return Compressed bytes, or kCodecError on encoder failure.
    [[nodiscard]] Result<std::vector<std::uint8_t>> recompress(
        std::span<const std::uint8_t> rawBytes);

    /// @brief Replace the Blob's data with a zstd payload.
    /// @note Clears whichever data member was set before and records rawSize.
    /// @throws FormatError if rawSize does not fit the raw_size field.
    static void wrap(OSMPBF::Blob& blob, std::span<const std::uint8_t> compressed,
                     std::size_t rawSize);

    /// @brief Set datasize to the serialized length of the new Blob.
    /// @throws FormatError if the length does not fit the datasize field.
    static void updateDatasize(OSMPBF::BlobHeader& header, std::size_t blobSize);

    /// @brief Decode a frame's blob, recompress it and rewrap it in place.
    /// @return Serialized Blob bytes matching the updated header datasize.
    [[nodiscard]] std::string transcode(format::Frame& frame);

    [[nodiscard]] CompressionLevel level() const noexcept { return level_; }

private:
    struct ContextDeleter {
        void operator()(void* ctx) const noexcept;
    };

    CompressionLevel level_;

    /// @brief ZSTD_CCtx (opaque to keep zstd.h out of the header).
    std::unique_ptr<void, ContextDeleter> context_;
};

}  // namespace zpbf::codec

#endif  // ZPBF_CODEC_RECOMPRESSOR_H
