// ======================================================================
// \title  framer_test.cpp
// \brief  Payload Framer unit tests
// ======================================================================

#include <gtest/gtest.h>
#include "errors.hpp"
#include "framer.hpp"
#include "protocol.hpp"
#include "test_support.hpp"

using namespace qrcast;

namespace {

std::vector<uint8_t> concat(const std::vector<Chunk>& chunks) {
    std::vector<uint8_t> out;
    for (const auto& c : chunks)
        out.insert(out.end(), c.payload.begin(), c.payload.end());
    return out;
}

Errc framing_error(const std::vector<uint8_t>& data, size_t chunk_size) {
    try {
        frame_payload(data, chunk_size);
    } catch (const TransferError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected TransferError";
    return Errc::FileUnreadable;
}

} // namespace

TEST(Framer, RoundTripAcrossSizes) {
    const size_t lengths[] = {1, 2, 99, 100, 101, 1000, 4097};
    const size_t chunk_sizes[] = {1, 7, 100, 1024};
    for (size_t len : lengths) {
        for (size_t c : chunk_sizes) {
            auto data = test::pattern_bytes(len, (uint32_t)(len + c));
            auto chunks = frame_payload(data, c);
            ASSERT_EQ((len + c - 1) / c, chunks.size()) << len << "/" << c;
            EXPECT_EQ(data, concat(chunks)) << len << "/" << c;
        }
    }
}

TEST(Framer, IndicesAreOrderedAndChecksummed) {
    auto data = test::pattern_bytes(2500);
    auto chunks = frame_payload(data, 1000);
    ASSERT_EQ(3u, chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(i, chunks[i].index);
        EXPECT_EQ(crc32(chunks[i].payload.data(), chunks[i].payload.size()),
                  chunks[i].checksum);
    }
    // last chunk keeps its real length
    EXPECT_EQ(500u, chunks.back().payload.size());
}

TEST(Framer, ExactMultipleHasNoShortChunk) {
    auto chunks = frame_payload(test::pattern_bytes(10000), 1000);
    ASSERT_EQ(10u, chunks.size());
    for (const auto& c : chunks)
        EXPECT_EQ(1000u, c.payload.size());
}

TEST(Framer, EmptyFileIsRejected) {
    EXPECT_EQ(Errc::EmptyFile, framing_error({}, 100));
}

TEST(Framer, ZeroChunkSizeIsInvalid) {
    EXPECT_EQ(Errc::InvalidConfiguration, framing_error(test::pattern_bytes(10), 0));
}

TEST(Framer, ChunkCountMustFitIndexField) {
    // 65535 one-byte chunks is the last size that still fits
    auto at_limit = frame_payload(std::vector<uint8_t>(kMaxChunks, 0xAB), 1);
    EXPECT_EQ(kMaxChunks, at_limit.size());
    EXPECT_EQ(Errc::OversizeFile,
              framing_error(std::vector<uint8_t>(kMaxChunks + 1, 0xAB), 1));
}

TEST(Framer, MaxChunkPayloadLeavesRoomForFrameFields) {
    EXPECT_EQ(0u, max_chunk_payload(kDataFrameOverhead));
    EXPECT_EQ(1u, max_chunk_payload(kDataFrameOverhead + 1));
    EXPECT_EQ(2331u - kDataFrameOverhead, max_chunk_payload(2331));
}
