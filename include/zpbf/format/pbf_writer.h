// =============================================================================
// zstd-pbf - PBF Frame Writer
// =============================================================================
// Writer for OSM PBF frames with atomic write support.
//
// This module provides:
// - PbfWriter: Writes length-prefixed BlobHeader/Blob frames
// - Atomic write support using a temporary file (<output>.tmp)
// - Signal handling for cleanup on SIGINT/SIGTERM
//
// Usage:
//   PbfWriter writer("/path/to/output.osm.pbf");
//   writer.writeFrame(header, blobBytes);
//   writer.finalize();  // Renames temp to final
//
// The final path never holds a partially written file: frames go to the
// temporary file, which is renamed on finalize() and removed on abort().
// =============================================================================

#ifndef ZPBF_FORMAT_PBF_WRITER_H
#define ZPBF_FORMAT_PBF_WRITER_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string_view>

#include "zpbf/common/error.h"
#include "zpbf/common/types.h"
#include "zpbf/format/pbf_format.h"

namespace zpbf::format {

// =============================================================================
// Signal Handler Management
// =============================================================================

/// @brief Register a temporary file to be unlinked on SIGINT/SIGTERM.
/// @return Slot handle for unregisterTempFileForCleanup(), or -1 if the path
///         is too long or every slot is taken.
/// @note Thread-safe. The handler itself only calls unlink() on the copied path.
[[nodiscard]] int registerTempFileForCleanup(const std::filesystem::path& tempPath);

/// @brief Release a slot returned by registerTempFileForCleanup(). -1 is ignored.
void unregisterTempFileForCleanup(int slot) noexcept;

/// @brief Install signal handlers for SIGINT and SIGTERM.
/// @note Called automatically when the first writer is created. Idempotent.
void installSignalHandlers();

// =============================================================================
// PbfWriter Class
// =============================================================================

/// @brief Writer for OSM PBF frames.
/// @note Implements atomic write using temporary file + rename strategy.
///
/// Error Handling:
/// - Throws UsageError if the output path or <output>.tmp already exists
/// - Throws IOError on file operation failures
/// - Throws FormatError if a header does not describe its blob
/// - Automatically removes the temp file on destruction if not finalized
class PbfWriter {
public:
    /// @brief Construct a writer for the specified output path.
    /// @throws UsageError if outputPath or its temporary file already exists.
    /// @throws IOError if the temporary file cannot be created.
    explicit PbfWriter(std::filesystem::path outputPath);

    /// @brief Destructor - removes the temp file if not finalized.
    ~PbfWriter();

    // Non-copyable, non-movable (owns a cleanup slot)
    PbfWriter(const PbfWriter&) = delete;
    PbfWriter& operator=(const PbfWriter&) = delete;
    PbfWriter(PbfWriter&&) = delete;
    PbfWriter& operator=(PbfWriter&&) = delete;

    /// @brief Write the 4-byte big-endian length prefix and the BlobHeader.
    /// @throws IOError on write failure.
    void writeBlobHeader(const OSMPBF::BlobHeader& header);

    /// @brief Write serialized Blob bytes.
    /// @throws IOError on write failure.
    void writeBlob(std::string_view blobBytes);

    /// @brief Write a complete frame.
    /// @param header Header whose datasize must equal blobBytes.size().
    /// @param blobBytes Serialized Blob.
    /// @throws FormatError if datasize does not match the blob length.
    /// @throws IOError on write failure.
    void writeFrame(const OSMPBF::BlobHeader& header, std::string_view blobBytes);

    /// @brief Flush, close and publish the output under its final name.
    /// @throws IOError on flush or rename failure, or if the final path
    ///         appeared while writing.
    void finalize();

    /// @brief Stop writing and remove the temporary file.
    /// @note Safe to call multiple times.
    void abort() noexcept;

    [[nodiscard]] bool isFinalized() const noexcept { return finalized_; }

    [[nodiscard]] bool isAborted() const noexcept { return aborted_; }

    [[nodiscard]] const std::filesystem::path& outputPath() const noexcept { return outputPath_; }

    [[nodiscard]] const std::filesystem::path& tempPath() const noexcept { return tempPath_; }

    /// @brief Total bytes written so far.
    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return bytesWritten_; }

    /// @brief Number of frames written so far.
    [[nodiscard]] FrameIndex framesWritten() const noexcept { return framesWritten_; }

private:
    /// @brief Write raw bytes to the file.
    /// @throws IOError on write failure.
    void writeBytes(const void* data, std::size_t size);

    /// @brief Throw if the writer no longer accepts data.
    void ensureWritable() const;

    /// @brief Close the stream and remove the temporary file.
    void cleanupTempFile() noexcept;

    void releaseCleanupSlot() noexcept;

    std::filesystem::path outputPath_;
    std::filesystem::path tempPath_;
    std::ofstream stream_;
    std::uint64_t bytesWritten_ = 0;
    FrameIndex framesWritten_ = 0;
    std::atomic<bool> finalized_{false};
    std::atomic<bool> aborted_{false};
    int cleanupSlot_ = -1;

    /// @brief Serializes frame writes and finalize().
    mutable std::mutex mutex_;
};

}  // namespace zpbf::format

#endif  // ZPBF_FORMAT_PBF_WRITER_H
