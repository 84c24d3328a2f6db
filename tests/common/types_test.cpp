// =============================================================================
// zstd-pbf - Compression Level Tests
// =============================================================================

#include <gtest/gtest.h>

#include "zpbf/common/types.h"

namespace zpbf::test {

TEST(CompressionLevelTest, PresetsMapToZstdLevels) {
    EXPECT_EQ(toZstdLevel(CompressionLevel::kFastest), 1);
    EXPECT_EQ(toZstdLevel(CompressionLevel::kDefault), 3);
    EXPECT_EQ(toZstdLevel(CompressionLevel::kBetter), 7);
    EXPECT_EQ(toZstdLevel(CompressionLevel::kBest), 11);
}

TEST(CompressionLevelTest, NamesParseBack) {
    for (auto level : {CompressionLevel::kFastest, CompressionLevel::kDefault,
                       CompressionLevel::kBetter, CompressionLevel::kBest}) {
        auto parsed = compressionLevelFromString(compressionLevelName(level));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, level);
    }
}

TEST(CompressionLevelTest, UnknownNameIsRejected) {
    EXPECT_FALSE(compressionLevelFromString("ultra").has_value());
    EXPECT_FALSE(compressionLevelFromString("").has_value());
}

TEST(FrameLimitsTest, HeaderCeilingIs64MiB) {
    EXPECT_EQ(kMaxBlobHeaderSize, 64u * 1024u * 1024u);
    EXPECT_EQ(kLengthPrefixSize, 4u);
}

}  // namespace zpbf::test
