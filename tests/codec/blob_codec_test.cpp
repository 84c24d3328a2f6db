// =============================================================================
// zstd-pbf - Blob Codec Resolver Tests
// =============================================================================
// Tests for extracting raw payloads from raw and zlib blobs and rejecting
// every other variant.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <string>
#include <vector>

#include "support/pbf_test_utils.h"
#include "zpbf/codec/blob_codec.h"

namespace zpbf::codec::test {

using zpbf::test::makeRawBlob;
using zpbf::test::makeZlibBlob;
using zpbf::test::toVector;
using zpbf::test::zlibCompress;

TEST(BlobCodecTest, SupportedSources) {
    EXPECT_TRUE(isSupportedSource(format::BlobVariant::kRaw));
    EXPECT_TRUE(isSupportedSource(format::BlobVariant::kZlib));
    EXPECT_FALSE(isSupportedSource(format::BlobVariant::kZstd));
    EXPECT_FALSE(isSupportedSource(format::BlobVariant::kLzma));
    EXPECT_FALSE(isSupportedSource(format::BlobVariant::kNone));
}

TEST(BlobCodecTest, RawIsReturnedUnchanged) {
    auto blob = makeRawBlob(std::string("a\0b", 3));
    EXPECT_EQ(toRawBytes(&blob), toVector(std::string("a\0b", 3)));
}

TEST(BlobCodecTest, ZlibIsInflated) {
    auto blob = makeZlibBlob("hello world");
    EXPECT_EQ(toRawBytes(&blob), toVector("hello world"));
}

TEST(BlobCodecTest, EmptyZlibPayload) {
    auto blob = makeZlibBlob("");
    EXPECT_TRUE(toRawBytes(&blob).empty());
}

TEST(BlobCodecTest, NullBlobIsMissing) {
    try {
        (void)toRawBytes(nullptr);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.message(), "missing blob");
    }
}

TEST(BlobCodecTest, BlobWithoutDataIsFormatError) {
    OSMPBF::Blob blob;
    blob.set_raw_size(10);
    EXPECT_THROW((void)toRawBytes(&blob), FormatError);
}

TEST(BlobCodecTest, RawSizeMismatchIsCorrupt) {
    auto shorter = makeZlibBlob("hello world");
    shorter.set_raw_size(5);
    EXPECT_THROW((void)toRawBytes(&shorter), FormatError);

    auto longer = makeZlibBlob("hello world");
    longer.set_raw_size(20);
    EXPECT_THROW((void)toRawBytes(&longer), FormatError);
}

TEST(BlobCodecTest, MissingOrNegativeRawSizeIsCorrupt) {
    OSMPBF::Blob missing;
    missing.set_zlib_data(zlibCompress("hello"));
    EXPECT_THROW((void)toRawBytes(&missing), FormatError);

    auto negative = makeZlibBlob("hello");
    negative.set_raw_size(-1);
    EXPECT_THROW((void)toRawBytes(&negative), FormatError);
}

TEST(BlobCodecTest, GarbageZlibIsCorrupt) {
    OSMPBF::Blob blob;
    blob.set_zlib_data("definitely not zlib");
    blob.set_raw_size(11);
    try {
        (void)toRawBytes(&blob);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_NE(e.message().find("corrupt zlib blob"), std::string::npos);
    }
}

TEST(BlobCodecTest, TruncatedZlibIsCorrupt) {
    std::string compressed = zlibCompress(std::string(1000, 'z'));
    auto result = inflateZlib(toVector(compressed.substr(0, compressed.size() / 2)), 1000);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);
}

TEST(BlobCodecTest, OtherVariantsAreUnsupported) {
    std::vector<OSMPBF::Blob> blobs(4);
    blobs[0].set_lzma_data("x");
    blobs[1].set_obsolete_bzip2_data("x");
    blobs[2].set_lz4_data("x");
    blobs[3].set_zstd_data("x");

    for (const auto& blob : blobs) {
        try {
            (void)toRawBytes(&blob);
            FAIL() << "expected UnsupportedError";
        } catch (const UnsupportedError& e) {
            EXPECT_EQ(e.code(), ErrorCode::kUnsupportedCodec);
            EXPECT_NE(e.message().find(format::blobVariantName(format::blobVariant(blob))),
                      std::string::npos);
        }
    }
}

RC_GTEST_PROP(BlobCodecProperty, ZlibYieldsOriginalBytes, (const std::string& payload)) {
    auto blob = makeZlibBlob(payload);
    RC_ASSERT(toRawBytes(&blob) == toVector(payload));
}

}  // namespace zpbf::codec::test
