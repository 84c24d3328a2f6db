// =============================================================================
// zstd-pbf - PBF Frame Writer Implementation
// =============================================================================
// Key features:
// - Atomic write using temporary file + rename strategy
// - Signal handling for cleanup on SIGINT/SIGTERM
// =============================================================================

#include "zpbf/format/pbf_writer.h"

#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <string>

#include "zpbf/common/logger.h"

namespace zpbf::format {

// =============================================================================
// Signal Handler Management
// =============================================================================

namespace {

constexpr std::size_t kMaxCleanupSlots = 16;

constexpr std::size_t kMaxCleanupPath = 4096;

enum SlotState : int { kSlotFree = 0, kSlotClaimed, kSlotActive };

static_assert(std::atomic<int>::is_always_lock_free);

/// @brief A temporary file the signal handler unlinks.
/// @note The path is written only while the slot is claimed, so the handler
///       never reads a half-copied name.
struct CleanupSlot {
    std::atomic<int> state{kSlotFree};
    char path[kMaxCleanupPath] = {};
};

CleanupSlot gCleanupSlots[kMaxCleanupSlots];

/// @brief Whether signal handlers have been installed.
std::atomic<bool> gSignalHandlersInstalled{false};

void (*gPreviousSigintHandler)(int) = nullptr;

void (*gPreviousSigtermHandler)(int) = nullptr;

// Only async-signal-safe calls below: atomic loads, unlink, signal, raise.
void signalHandler(int signum) {
    for (auto& slot : gCleanupSlots) {
        if (slot.state.load(std::memory_order_acquire) == kSlotActive) {
            ::unlink(slot.path);
        }
    }

    if (signum == SIGINT && gPreviousSigintHandler != nullptr &&
        gPreviousSigintHandler != SIG_DFL && gPreviousSigintHandler != SIG_IGN) {
        gPreviousSigintHandler(signum);
    } else if (signum == SIGTERM && gPreviousSigtermHandler != nullptr &&
               gPreviousSigtermHandler != SIG_DFL && gPreviousSigtermHandler != SIG_IGN) {
        gPreviousSigtermHandler(signum);
    } else {
        // Re-raise with the default action so the exit status reflects the signal
        std::signal(signum, SIG_DFL);
        std::raise(signum);
    }
}

}  // namespace

int registerTempFileForCleanup(const std::filesystem::path& tempPath) {
    const std::string& name = tempPath.native();
    if (name.size() >= kMaxCleanupPath) {
        ZPBF_LOG_WARNING("Path too long for interrupt cleanup: {}", name);
        return -1;
    }

    for (std::size_t i = 0; i < kMaxCleanupSlots; ++i) {
        auto& slot = gCleanupSlots[i];
        int expected = kSlotFree;
        if (slot.state.compare_exchange_strong(expected, kSlotClaimed)) {
            std::memcpy(slot.path, name.c_str(), name.size() + 1);
            slot.state.store(kSlotActive, std::memory_order_release);
            return static_cast<int>(i);
        }
    }

    ZPBF_LOG_WARNING("All {} cleanup slots in use, {} is not removed on interrupt",
                     kMaxCleanupSlots, name);
    return -1;
}

void unregisterTempFileForCleanup(int slot) noexcept {
    if (slot < 0 || static_cast<std::size_t>(slot) >= kMaxCleanupSlots) {
        return;
    }
    gCleanupSlots[slot].state.store(kSlotFree, std::memory_order_release);
}

void installSignalHandlers() {
    bool expected = false;
    if (!gSignalHandlersInstalled.compare_exchange_strong(expected, true)) {
        return;
    }

    gPreviousSigintHandler = std::signal(SIGINT, signalHandler);
    if (gPreviousSigintHandler == SIG_ERR) {
        ZPBF_LOG_WARNING("Failed to install SIGINT handler");
        gPreviousSigintHandler = nullptr;
    }

    gPreviousSigtermHandler = std::signal(SIGTERM, signalHandler);
    if (gPreviousSigtermHandler == SIG_ERR) {
        ZPBF_LOG_WARNING("Failed to install SIGTERM handler");
        gPreviousSigtermHandler = nullptr;
    }

    ZPBF_LOG_DEBUG("Signal handlers installed for SIGINT and SIGTERM");
}

// =============================================================================
// PbfWriter Implementation
// =============================================================================

PbfWriter::PbfWriter(std::filesystem::path outputPath)
    : outputPath_(std::move(outputPath)), tempPath_(outputPath_.string() + ".tmp") {
    std::error_code ec;
    if (std::filesystem::exists(outputPath_, ec)) {
        throw UsageError("The file '" + outputPath_.string() + "' already exists",
                         ErrorContext(outputPath_.string()));
    }

    // abort() deletes the temporary file, so it must be one this writer created
    if (std::filesystem::exists(tempPath_, ec)) {
        throw UsageError("The file '" + tempPath_.string() + "' already exists",
                         ErrorContext(tempPath_.string()));
    }

    installSignalHandlers();

    stream_.open(tempPath_, std::ios::binary | std::ios::noreplace);
    if (!stream_.is_open()) {
        throw IOError("Could not open file '" + tempPath_.string() + "'",
                      std::error_code(errno, std::generic_category()),
                      ErrorContext(tempPath_.string()));
    }

    cleanupSlot_ = registerTempFileForCleanup(tempPath_);

    ZPBF_LOG_DEBUG("PbfWriter created: output={}, temp={}", outputPath_.string(),
                   tempPath_.string());
}

PbfWriter::~PbfWriter() {
    if (!finalized_ && !aborted_) {
        abort();
    }
    releaseCleanupSlot();
}

void PbfWriter::writeBlobHeader(const OSMPBF::BlobHeader& header) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureWritable();

    std::string rawHeader = serializeBlobHeader(header);
    auto prefix = encodeLengthPrefix(static_cast<std::uint32_t>(rawHeader.size()));

    writeBytes(prefix.data(), prefix.size());
    writeBytes(rawHeader.data(), rawHeader.size());
}

void PbfWriter::writeBlob(std::string_view blobBytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureWritable();

    writeBytes(blobBytes.data(), blobBytes.size());
    ++framesWritten_;
}

void PbfWriter::writeFrame(const OSMPBF::BlobHeader& header, std::string_view blobBytes) {
    if (header.datasize() < 0 ||
        static_cast<std::size_t>(header.datasize()) != blobBytes.size()) {
        throw FormatError("BlobHeader datasize " + std::to_string(header.datasize()) +
                              " does not match blob length " + std::to_string(blobBytes.size()),
                          ErrorContext(outputPath_.string()).withFrame(framesWritten_));
    }

    writeBlobHeader(header);
    writeBlob(blobBytes);
}

void PbfWriter::finalize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (finalized_) {
        return;
    }

    if (aborted_) {
        throw IOError("Cannot finalize aborted writer", ErrorContext(outputPath_.string()));
    }

    stream_.flush();
    if (!stream_.good()) {
        throw IOError("Failed to flush output file", ErrorContext(tempPath_.string()));
    }
    stream_.close();
    if (stream_.fail()) {
        throw IOError("Failed to close output file", ErrorContext(tempPath_.string()));
    }

    std::error_code ec;
    if (std::filesystem::exists(outputPath_, ec)) {
        throw IOError("The file '" + outputPath_.string() + "' appeared while writing",
                      ErrorContext(outputPath_.string()));
    }

    std::filesystem::rename(tempPath_, outputPath_, ec);
    if (ec) {
        throw IOError("Failed to rename temporary file to final output", ec,
                      ErrorContext(outputPath_.string()));
    }

    finalized_ = true;
    releaseCleanupSlot();

    ZPBF_LOG_INFO("PBF output finalized: {}, frames={}, bytes={}", outputPath_.string(),
                  framesWritten_, bytesWritten_);
}

void PbfWriter::abort() noexcept {
    bool expected = false;
    if (!aborted_.compare_exchange_strong(expected, true)) {
        return;
    }

    cleanupTempFile();
    releaseCleanupSlot();

    ZPBF_LOG_DEBUG("PbfWriter aborted: {}", tempPath_.string());
}

// =============================================================================
// Private Methods
// =============================================================================

void PbfWriter::writeBytes(const void* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    stream_.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!stream_.good()) {
        throw IOError("Failed to write to file", ErrorContext(tempPath_.string()));
    }
    bytesWritten_ += size;
}

void PbfWriter::ensureWritable() const {
    if (finalized_ || aborted_) {
        throw IOError("Writer is finalized or aborted", ErrorContext(outputPath_.string()));
    }
}

void PbfWriter::releaseCleanupSlot() noexcept {
    unregisterTempFileForCleanup(cleanupSlot_);
    cleanupSlot_ = -1;
}

void PbfWriter::cleanupTempFile() noexcept {
    if (stream_.is_open()) {
        stream_.close();
    }

    std::error_code ec;
    if (std::filesystem::exists(tempPath_, ec)) {
        std::filesystem::remove(tempPath_, ec);
        if (ec) {
            ZPBF_LOG_WARNING("Failed to remove temporary file: {}", tempPath_.string());
        }
    }
}

}  // namespace zpbf::format
