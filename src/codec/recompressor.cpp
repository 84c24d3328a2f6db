// =============================================================================
// zstd-pbf - Zstd Recompressor Implementation
// =============================================================================

#include "zpbf/codec/recompressor.h"

#include <zstd.h>

#include <limits>
#include <string>

#include "zpbf/codec/blob_codec.h"
#include "zpbf/common/logger.h"

namespace zpbf::codec {

namespace {

constexpr auto kMaxFieldValue = static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max());

}  // namespace

// =============================================================================
// Recompressor Implementation
// =============================================================================

void Recompressor::ContextDeleter::operator()(void* ctx) const noexcept {
    ZSTD_freeCCtx(static_cast<ZSTD_CCtx*>(ctx));
}

Recompressor::Recompressor(CompressionLevel level) : level_(level) {
    context_.reset(ZSTD_createCCtx());
    if (!context_) {
        throw CodecError("Failed to create zstd compression context");
    }

    auto* cctx = static_cast<ZSTD_CCtx*>(context_.get());
    std::size_t ret = ZSTD_CCtx_setParameter(cctx, ZSTD_c_compressionLevel, toZstdLevel(level_));
    if (ZSTD_isError(ret)) {
        throw CodecError("Failed to set zstd compression level: " +
                         std::string(ZSTD_getErrorName(ret)));
    }
    ret = ZSTD_CCtx_setParameter(cctx, ZSTD_c_contentSizeFlag, 1);
    if (ZSTD_isError(ret)) {
        throw CodecError("Failed to enable zstd content size: " +
                         std::string(ZSTD_getErrorName(ret)));
    }

    ZPBF_LOG_DEBUG("Recompressor created: level={} (zstd {})", compressionLevelName(level_),
                   toZstdLevel(level_));
}

Recompressor::~Recompressor() = default;

Recompressor::Recompressor(Recompressor&&) noexcept = default;
Recompressor& Recompressor::operator=(Recompressor&&) noexcept = default;

Result<std::vector<std::uint8_t>> Recompressor::recompress(
    std::span<const std::uint8_t> rawBytes) {
    if (!context_) {
        return makeError<std::vector<std::uint8_t>>(ErrorCode::kCodecError,
                                                    "Recompressor has no zstd context");
    }

    std::size_t compressBound = ZSTD_compressBound(rawBytes.size());
    std::vector<std::uint8_t> compressed(compressBound);

    std::size_t compressedSize =
        ZSTD_compress2(static_cast<ZSTD_CCtx*>(context_.get()), compressed.data(),
                       compressed.size(), rawBytes.data(), rawBytes.size());

    if (ZSTD_isError(compressedSize)) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kCodecError,
            "Zstd compression failed: " + std::string(ZSTD_getErrorName(compressedSize)));
    }

    compressed.resize(compressedSize);
    return compressed;
}

void Recompressor::wrap(OSMPBF::Blob& blob, std::span<const std::uint8_t> compressed,
                        std::size_t rawSize) {
    if (rawSize > kMaxFieldValue) {
        throw FormatError("raw size " + std::to_string(rawSize) + " exceeds the Blob limit");
    }

    // Setting a oneof member clears the one previously set
    blob.set_zstd_data(
        std::string(reinterpret_cast<const char*>(compressed.data()), compressed.size()));
    blob.set_raw_size(static_cast<std::int32_t>(rawSize));
}

void Recompressor::updateDatasize(OSMPBF::BlobHeader& header, std::size_t blobSize) {
    if (blobSize > kMaxFieldValue) {
        throw FormatError("Blob size " + std::to_string(blobSize) + " exceeds the datasize limit");
    }
    header.set_datasize(static_cast<std::int32_t>(blobSize));
}

std::string Recompressor::transcode(format::Frame& frame) {
    const auto sourceVariant = format::blobVariant(frame.blob);
    const auto sourceSize = static_cast<std::size_t>(frame.header.datasize());

    std::vector<std::uint8_t> raw = toRawBytes(&frame.blob);
    std::vector<std::uint8_t> compressed = unwrapOrThrow(recompress(raw));

    wrap(frame.blob, compressed, raw.size());

    std::string blobBytes = format::serializeBlob(frame.blob);
    updateDatasize(frame.header, blobBytes.size());

    ZPBF_LOG_TRACE("Blob transcoded: {} {} -> zstd {} bytes (raw {})",
                   format::blobVariantName(sourceVariant), sourceSize, blobBytes.size(),
                   raw.size());
    return blobBytes;
}

}  // namespace zpbf::codec
