// =============================================================================
// zstd-pbf - Blob Codec Resolver Implementation
// =============================================================================

#include "zpbf/codec/blob_codec.h"

#include <zlib.h>

#include <cstring>
#include <limits>
#include <string>

#include "zpbf/common/logger.h"

namespace zpbf::codec {

namespace {

/// @brief View the bytes of a protobuf bytes field.
std::span<const std::uint8_t> asBytes(std::string_view data) noexcept {
    return {reinterpret_cast<const std::uint8_t*>(data.data()), data.size()};
}

}  // namespace

// =============================================================================
// zlib Decoding
// =============================================================================

Result<std::vector<std::uint8_t>> inflateZlib(std::span<const std::uint8_t> data,
                                              std::size_t rawSize) {
    if (data.size() > std::numeric_limits<uInt>::max() ||
        rawSize >= std::numeric_limits<uInt>::max()) {
        return makeError<std::vector<std::uint8_t>>(ErrorCode::kFormatError,
                                                    "corrupt zlib blob: payload too large");
    }

    z_stream stream;
    std::memset(&stream, 0, sizeof(z_stream));

    int ret = inflateInit(&stream);
    if (ret != Z_OK) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kCodecError, "Failed to initialize zlib: " + std::string(zError(ret)));
    }

    // One spare byte detects streams that inflate past the declared size
    std::vector<std::uint8_t> output(rawSize + 1);

    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = output.data();
    stream.avail_out = static_cast<uInt>(output.size());

    ret = inflate(&stream, Z_FINISH);
    std::size_t produced = stream.total_out;
    inflateEnd(&stream);

    if (ret != Z_STREAM_END) {
        std::string reason = (ret == Z_BUF_ERROR && produced > rawSize)
                                 ? "more than " + std::to_string(rawSize) + " bytes"
                             : ret == Z_BUF_ERROR ? "unexpected end of stream"
                                                  : std::string(zError(ret));
        return makeError<std::vector<std::uint8_t>>(ErrorCode::kFormatError,
                                                    "corrupt zlib blob: " + reason);
    }
    if (produced != rawSize) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kFormatError, "corrupt zlib blob: expected " + std::to_string(rawSize) +
                                         " bytes, got " + std::to_string(produced));
    }

    output.resize(rawSize);
    return output;
}

// =============================================================================
// Blob Decoding
// =============================================================================

std::vector<std::uint8_t> toRawBytes(const OSMPBF::Blob* blob) {
    if (blob == nullptr) {
        throw FormatError("missing blob");
    }

    const auto variant = format::blobVariant(*blob);
    if (variant == format::BlobVariant::kNone) {
        throw FormatError("blob has no data");
    }
    if (!isSupportedSource(variant)) {
        throw UnsupportedError("found unsupported blob format: " +
                               std::string(format::blobVariantName(variant)));
    }

    if (variant == format::BlobVariant::kRaw) {
        auto bytes = asBytes(blob->raw());
        return {bytes.begin(), bytes.end()};
    }

    if (!blob->has_raw_size() || blob->raw_size() < 0) {
        throw FormatError("corrupt zlib blob: missing or negative raw_size");
    }
    auto result =
        inflateZlib(asBytes(blob->zlib_data()), static_cast<std::size_t>(blob->raw_size()));
    ZPBF_LOG_TRACE("zlib blob inflated: {} -> {} bytes", blob->zlib_data().size(),
                   blob->raw_size());
    return unwrapOrThrow(std::move(result));
}

}  // namespace zpbf::codec
