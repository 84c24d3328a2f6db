// =============================================================================
// zstd-pbf - Common Type Definitions
// =============================================================================
// Core type definitions shared by the zstd-pbf library.
//
// This module defines:
// - CompressionLevel: Named zstd speed/ratio presets
// - Size limits of the OSM PBF container
// - FrameIndex, FileOffset: Type aliases for stream positions
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef ZPBF_COMMON_TYPES_H
#define ZPBF_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace zpbf {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Zero-based position of a frame in the container stream.
using FrameIndex = std::uint64_t;

/// @brief Type alias for file offsets.
using FileOffset = std::uint64_t;

// =============================================================================
// Container Limits
// =============================================================================

/// @brief Hard ceiling on the serialized BlobHeader size.
/// @note A header length prefix at or above this value is rejected.
inline constexpr std::uint32_t kMaxBlobHeaderSize = 64 * 1024 * 1024;

/// @brief Size of the big-endian header length prefix.
inline constexpr std::size_t kLengthPrefixSize = 4;

// =============================================================================
// Compression Level
// =============================================================================

/// @brief Named zstd compression presets.
/// @note Selected once per run and passed by value into the Recompressor.
enum class CompressionLevel : std::uint8_t {
    kFastest = 0,  ///< Fastest encoding
    kDefault = 1,  ///< Balanced speed and ratio
    kBetter = 2,   ///< Better ratio than default
    kBest = 3      ///< Best ratio, slowest
};

/// @brief Map a preset onto the native zstd compression level.
[[nodiscard]] constexpr int toZstdLevel(CompressionLevel level) noexcept {
    switch (level) {
        case CompressionLevel::kFastest:
            return 1;
        case CompressionLevel::kDefault:
            return 3;
        case CompressionLevel::kBetter:
            return 7;
        case CompressionLevel::kBest:
            return 11;
    }
    return 3;
}

/// @brief Get the preset name used on the command line.
[[nodiscard]] constexpr std::string_view compressionLevelName(CompressionLevel level) noexcept {
    switch (level) {
        case CompressionLevel::kFastest:
            return "fastest";
        case CompressionLevel::kDefault:
            return "default";
        case CompressionLevel::kBetter:
            return "better";
        case CompressionLevel::kBest:
            return "best";
    }
    return "default";
}

/// @brief Parse a preset name.
/// @return The preset, or std::nullopt for unknown names.
[[nodiscard]] constexpr std::optional<CompressionLevel> compressionLevelFromString(
    std::string_view name) noexcept {
    if (name == "fastest") {
        return CompressionLevel::kFastest;
    }
    if (name == "default") {
        return CompressionLevel::kDefault;
    }
    if (name == "better") {
        return CompressionLevel::kBetter;
    }
    if (name == "best") {
        return CompressionLevel::kBest;
    }
    return std::nullopt;
}

}  // namespace zpbf

#endif  // ZPBF_COMMON_TYPES_H
