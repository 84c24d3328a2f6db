// =============================================================================
// zstd-pbf - Blob Codec Resolver
// =============================================================================
// Extracts the uncompressed payload of a Blob.
//
// Supported source variants:
// - raw:  returned unchanged
// - zlib: inflated and checked against the declared raw_size
//
// Every other variant (lzma, bzip2, lz4, zstd) is rejected with
// UnsupportedError so nothing is passed through mis-transcoded.
// =============================================================================

#ifndef ZPBF_CODEC_BLOB_CODEC_H
#define ZPBF_CODEC_BLOB_CODEC_H

#include <cstdint>
#include <span>
#include <vector>

#include "zpbf/common/error.h"
#include "zpbf/format/pbf_format.h"

namespace zpbf::codec {

/// @brief Check whether a variant can be decoded as a transcoding source.
[[nodiscard]] constexpr bool isSupportedSource(format::BlobVariant variant) noexcept {
    return variant == format::BlobVariant::kRaw || variant == format::BlobVariant::kZlib;
}

/// @brief Inflate a zlib stream into exactly rawSize bytes.
/// @return The decompressed bytes, or kFormatError if the stream is corrupt
///         or does not produce exactly rawSize bytes, or kCodecError if the
///         decoder cannot be initialized.
[[nodiscard]] Result<std::vector<std::uint8_t>> inflateZlib(std::span<const std::uint8_t> data,
                                                            std::size_t rawSize);

/// @brief Extract the uncompressed payload of a Blob.
/// @param blob Blob to decode; must not be null.
/// @return Raw bytes.
/// @throws FormatError for a null blob, a blob without data, a missing or
///         negative raw_size, or a corrupt zlib payload.
/// @throws UnsupportedError for any variant other than raw or zlib.
/// @throws CodecError if the zlib decoder cannot be initialized.
[[nodiscard]] std::vector<std::uint8_t> toRawBytes(const OSMPBF::Blob* blob);

}  // namespace zpbf::codec

#endif  // ZPBF_CODEC_BLOB_CODEC_H
