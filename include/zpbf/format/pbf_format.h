// =============================================================================
// zstd-pbf - OSM PBF Container Format
// =============================================================================
// Definitions for the length-prefixed BlobHeader/Blob framing of OSM PBF files.
//
// Wire layout (repeated until end of stream):
//
//   +----------------------+--------------------------+------------------------+
//   | uint32 headerLength  | BlobHeader               | Blob                   |
//   | (big-endian)         | (headerLength bytes)     | (header.datasize bytes)|
//   +----------------------+--------------------------+------------------------+
//
// The length prefix describes the serialized BlobHeader only; the BlobHeader's
// datasize field describes the serialized Blob that follows it.
//
// BlobHeader and Blob are protobuf messages generated from fileformat.proto.
// =============================================================================

#ifndef ZPBF_FORMAT_PBF_FORMAT_H
#define ZPBF_FORMAT_PBF_FORMAT_H

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "fileformat.pb.h"

namespace zpbf::format {

// =============================================================================
// Blob Types
// =============================================================================

/// @brief BlobHeader type of the first frame of a file.
inline constexpr std::string_view kBlobTypeHeader = "OSMHeader";

/// @brief BlobHeader type of entity data frames.
inline constexpr std::string_view kBlobTypeData = "OSMData";

// =============================================================================
// Frame
// =============================================================================

/// @brief One BlobHeader + Blob record as stored on the wire.
struct Frame {
    OSMPBF::BlobHeader header;
    OSMPBF::Blob blob;
};

// =============================================================================
// Blob Variants
// =============================================================================

/// @brief Compression variant held by a Blob's data oneof.
enum class BlobVariant : std::uint8_t {
    kNone = 0,   ///< No data member set
    kRaw = 1,    ///< Uncompressed bytes
    kZlib = 2,   ///< zlib stream
    kLzma = 3,   ///< LZMA stream
    kBzip2 = 4,  ///< Obsolete bzip2 stream
    kLz4 = 5,    ///< LZ4 stream
    kZstd = 6    ///< Zstandard frame
};

/// @brief Determine which data member a Blob holds.
[[nodiscard]] BlobVariant blobVariant(const OSMPBF::Blob& blob) noexcept;

/// @brief Get the human-readable name of a variant.
[[nodiscard]] std::string_view blobVariantName(BlobVariant variant) noexcept;

// =============================================================================
// Length Prefix
// =============================================================================

/// @brief Encode a header length as 4 big-endian bytes.
[[nodiscard]] constexpr std::array<std::uint8_t, 4> encodeLengthPrefix(
    std::uint32_t length) noexcept {
    return {static_cast<std::uint8_t>(length >> 24), static_cast<std::uint8_t>(length >> 16),
            static_cast<std::uint8_t>(length >> 8), static_cast<std::uint8_t>(length)};
}

/// @brief Decode 4 big-endian bytes into a header length.
[[nodiscard]] constexpr std::uint32_t decodeLengthPrefix(
    std::span<const std::uint8_t, 4> bytes) noexcept {
    return (static_cast<std::uint32_t>(bytes[0]) << 24) |
           (static_cast<std::uint32_t>(bytes[1]) << 16) |
           (static_cast<std::uint32_t>(bytes[2]) << 8) | static_cast<std::uint32_t>(bytes[3]);
}

// =============================================================================
// Serialization
// =============================================================================

/// @brief Serialize a Blob to its wire bytes.
/// @throws FormatError if the message cannot be serialized.
[[nodiscard]] std::string serializeBlob(const OSMPBF::Blob& blob);

/// @brief Serialize a BlobHeader to its wire bytes (without length prefix).
/// @throws FormatError if the message cannot be serialized or exceeds
///         the header size ceiling.
[[nodiscard]] std::string serializeBlobHeader(const OSMPBF::BlobHeader& header);

}  // namespace zpbf::format

#endif  // ZPBF_FORMAT_PBF_FORMAT_H
