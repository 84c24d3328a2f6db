// =============================================================================
// zstd-pbf - PBF Frame Reader Implementation
// =============================================================================

#include "zpbf/format/pbf_reader.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <fstream>
#include <string_view>

#include "zpbf/common/logger.h"

namespace zpbf::format {

namespace {

/// @brief Largest read issued at once; buffers grow only as data arrives.
constexpr std::size_t kReadChunkSize = 1024 * 1024;

}  // namespace

// =============================================================================
// PbfReader Implementation
// =============================================================================

PbfReader::PbfReader(const std::filesystem::path& inputPath)
    : sourceName_(inputPath.string()) {
    auto file = std::make_unique<std::ifstream>(inputPath, std::ios::binary);
    if (!file->is_open()) {
        throw IOError("Could not open file '" + sourceName_ + "'",
                      std::error_code(errno, std::generic_category()),
                      ErrorContext(sourceName_));
    }
    stream_ = std::move(file);

    ZPBF_LOG_DEBUG("PbfReader opened: {}", sourceName_);
}

PbfReader::PbfReader(std::unique_ptr<std::istream> source, std::string sourceName)
    : stream_(std::move(source)), sourceName_(std::move(sourceName)) {
    if (!stream_) {
        throw IOError("No source stream available", ErrorContext(sourceName_));
    }
}

PbfReader::~PbfReader() = default;

PbfReader::PbfReader(PbfReader&&) noexcept = default;
PbfReader& PbfReader::operator=(PbfReader&&) noexcept = default;

std::optional<OSMPBF::BlobHeader> PbfReader::readBlobHeader() {
    frameOffset_ = bytesRead_;

    std::array<std::uint8_t, kLengthPrefixSize> prefix{};
    std::size_t got = readBytes(prefix.data(), prefix.size());
    if (got == 0) {
        ZPBF_LOG_DEBUG("End of stream after {} frames: {}", framesRead_, sourceName_);
        return std::nullopt;
    }
    if (got < prefix.size()) {
        throw FormatError("Could not read BlobHeader: truncated header length (" +
                              std::to_string(got) + " of 4 bytes)",
                          frameContext());
    }

    std::uint32_t headerSize = decodeLengthPrefix(std::span<const std::uint8_t, 4>(prefix));
    if (headerSize >= kMaxBlobHeaderSize) {
        throw FormatError("Could not read BlobHeader: header too large (" +
                              std::to_string(headerSize) + " >= 64 MiB)",
                          frameContext());
    }

    std::string rawHeader = readExact(headerSize, "BlobHeader");

    OSMPBF::BlobHeader header;
    if (!header.ParseFromString(rawHeader)) {
        throw FormatError("Could not read BlobHeader: invalid header encoding", frameContext());
    }
    if (header.datasize() < 0) {
        throw FormatError("Could not read BlobHeader: negative datasize " +
                              std::to_string(header.datasize()),
                          frameContext());
    }

    ZPBF_LOG_TRACE("BlobHeader read: frame={}, type={}, headerSize={}, datasize={}",
                   framesRead_, header.type(), headerSize, header.datasize());
    return header;
}

OSMPBF::Blob PbfReader::readBlob(const OSMPBF::BlobHeader& header) {
    if (header.datasize() < 0) {
        throw FormatError("Could not read Blob: negative datasize " +
                              std::to_string(header.datasize()),
                          frameContext());
    }

    std::string rawBlob = readExact(static_cast<std::size_t>(header.datasize()), "Blob");

    OSMPBF::Blob blob;
    if (!blob.ParseFromString(rawBlob)) {
        throw FormatError("Could not read Blob: invalid blob encoding", frameContext());
    }

    ++framesRead_;
    return blob;
}

std::optional<Frame> PbfReader::readFrame() {
    auto header = readBlobHeader();
    if (!header) {
        return std::nullopt;
    }
    Frame frame;
    frame.blob = readBlob(*header);
    frame.header = std::move(*header);
    return frame;
}

ErrorContext PbfReader::frameContext() const {
    return ErrorContext(sourceName_).withFrame(framesRead_).withOffset(frameOffset_);
}

// =============================================================================
// Private Methods
// =============================================================================

std::size_t PbfReader::readBytes(void* buffer, std::size_t size) {
    if (size == 0) {
        return 0;
    }
    stream_->read(static_cast<char*>(buffer), static_cast<std::streamsize>(size));
    if (stream_->bad()) {
        throw IOError("Failed to read from file", frameContext());
    }
    auto got = static_cast<std::size_t>(stream_->gcount());
    bytesRead_ += got;
    return got;
}

std::string PbfReader::readExact(std::size_t size, std::string_view what) {
    std::string buffer;
    std::size_t got = 0;
    while (got < size) {
        std::size_t chunk = std::min(size - got, kReadChunkSize);
        buffer.resize(got + chunk);
        std::size_t n = readBytes(buffer.data() + got, chunk);
        got += n;
        if (n < chunk) {
            break;
        }
    }

    if (got != size) {
        throw FormatError("Could not read " + std::string(what) + ": truncated (" +
                              std::to_string(got) + " of " + std::to_string(size) +
                              " bytes)",
                          frameContext());
    }
    return buffer;
}

}  // namespace zpbf::format
