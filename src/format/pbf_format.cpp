// =============================================================================
// zstd-pbf - OSM PBF Container Format Implementation
// =============================================================================

#include "zpbf/format/pbf_format.h"

#include "zpbf/common/error.h"
#include "zpbf/common/types.h"

namespace zpbf::format {

// =============================================================================
// Blob Variants
// =============================================================================

BlobVariant blobVariant(const OSMPBF::Blob& blob) noexcept {
    switch (blob.data_case()) {
        case OSMPBF::Blob::kRaw:
            return BlobVariant::kRaw;
        case OSMPBF::Blob::kZlibData:
            return BlobVariant::kZlib;
        case OSMPBF::Blob::kLzmaData:
            return BlobVariant::kLzma;
        case OSMPBF::Blob::kOBSOLETEBzip2Data:
            return BlobVariant::kBzip2;
        case OSMPBF::Blob::kLz4Data:
            return BlobVariant::kLz4;
        case OSMPBF::Blob::kZstdData:
            return BlobVariant::kZstd;
        case OSMPBF::Blob::DATA_NOT_SET:
            return BlobVariant::kNone;
    }
    return BlobVariant::kNone;
}

std::string_view blobVariantName(BlobVariant variant) noexcept {
    switch (variant) {
        case BlobVariant::kNone:
            return "none";
        case BlobVariant::kRaw:
            return "raw";
        case BlobVariant::kZlib:
            return "zlib";
        case BlobVariant::kLzma:
            return "lzma";
        case BlobVariant::kBzip2:
            return "bzip2";
        case BlobVariant::kLz4:
            return "lz4";
        case BlobVariant::kZstd:
            return "zstd";
    }
    return "unknown";
}

// =============================================================================
// Serialization
// =============================================================================

std::string serializeBlob(const OSMPBF::Blob& blob) {
    std::string bytes;
    if (!blob.SerializeToString(&bytes)) {
        throw FormatError("Could not serialize Blob");
    }
    return bytes;
}

std::string serializeBlobHeader(const OSMPBF::BlobHeader& header) {
    if (!header.IsInitialized()) {
        throw FormatError("Could not serialize BlobHeader: missing datasize");
    }
    std::string bytes;
    if (!header.SerializeToString(&bytes)) {
        throw FormatError("Could not serialize BlobHeader");
    }
    if (bytes.size() >= kMaxBlobHeaderSize) {
        throw FormatError("BlobHeader size " + std::to_string(bytes.size()) + " >= 64 MiB");
    }
    return bytes;
}

}  // namespace zpbf::format
