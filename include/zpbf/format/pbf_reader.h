// =============================================================================
// zstd-pbf - PBF Frame Reader
// =============================================================================
// Sequential reader for the length-prefixed frames of an OSM PBF stream.
//
// This module provides:
// - PbfReader: Reads BlobHeader and Blob messages in arrival order
// - Clean end-of-stream detection on a frame boundary
// - Size ceiling and truncation checks on every frame
//
// Usage:
//   PbfReader reader("/path/to/input.osm.pbf");
//   while (auto header = reader.readBlobHeader()) {
//       auto blob = reader.readBlob(*header);
//       // process frame...
//   }
// =============================================================================

#ifndef ZPBF_FORMAT_PBF_READER_H
#define ZPBF_FORMAT_PBF_READER_H

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>

#include "zpbf/common/error.h"
#include "zpbf/common/types.h"
#include "zpbf/format/pbf_format.h"

namespace zpbf::format {

/// @brief Reader for OSM PBF frames.
///
/// Error Handling:
/// - Throws IOError when the underlying stream fails
/// - Throws FormatError on oversize, truncated or undecodable frames
class PbfReader {
public:
    /// @brief Open a file for reading.
    /// @throws IOError if the file cannot be opened.
    explicit PbfReader(const std::filesystem::path& inputPath);

    /// @brief Read from an existing stream.
    /// @param source Stream positioned at a frame boundary.
    /// @param sourceName Name used in error messages.
    PbfReader(std::unique_ptr<std::istream> source, std::string sourceName);

    ~PbfReader();

    PbfReader(const PbfReader&) = delete;
    PbfReader& operator=(const PbfReader&) = delete;
    PbfReader(PbfReader&&) noexcept;
    PbfReader& operator=(PbfReader&&) noexcept;

    /// @brief Read the next length prefix and BlobHeader.
    /// @return The header, or std::nullopt at a clean end of stream.
    /// @throws FormatError if the prefix is truncated, the length is at or
    ///         above kMaxBlobHeaderSize, or the header cannot be decoded.
    [[nodiscard]] std::optional<OSMPBF::BlobHeader> readBlobHeader();

    /// @brief Read the Blob announced by a header.
    /// @throws FormatError if fewer than datasize bytes remain or the bytes
    ///         cannot be decoded.
    [[nodiscard]] OSMPBF::Blob readBlob(const OSMPBF::BlobHeader& header);

    /// @brief Read a complete frame.
    /// @return The frame, or std::nullopt at a clean end of stream.
    [[nodiscard]] std::optional<Frame> readFrame();

    /// @brief Number of complete frames read so far.
    [[nodiscard]] FrameIndex framesRead() const noexcept { return framesRead_; }

    /// @brief Total bytes consumed from the stream.
    [[nodiscard]] FileOffset bytesRead() const noexcept { return bytesRead_; }

    /// @brief Offset at which the current (or last) frame started.
    [[nodiscard]] FileOffset frameOffset() const noexcept { return frameOffset_; }

    /// @brief Name of the source used in error messages.
    [[nodiscard]] const std::string& sourceName() const noexcept { return sourceName_; }

    /// @brief Error context describing the frame being read.
    [[nodiscard]] ErrorContext frameContext() const;

private:
    /// @brief Read up to size bytes.
    /// @return Number of bytes read; less than size only at end of stream.
    /// @throws IOError if the stream fails.
    std::size_t readBytes(void* buffer, std::size_t size);

    /// @brief Read exactly size bytes in bounded chunks.
    /// @note A corrupt size costs memory only for the bytes actually present.
    /// @throws FormatError naming what if the stream ends early.
    [[nodiscard]] std::string readExact(std::size_t size, std::string_view what);

    std::unique_ptr<std::istream> stream_;
    std::string sourceName_;
    FrameIndex framesRead_ = 0;
    FileOffset bytesRead_ = 0;
    FileOffset frameOffset_ = 0;
};

}  // namespace zpbf::format

#endif  // ZPBF_FORMAT_PBF_READER_H
