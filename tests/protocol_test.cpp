// ======================================================================
// \title  protocol_test.cpp
// \brief  Frame wire codec tests
// ======================================================================

#include <gtest/gtest.h>
#include <cstring>
#include "protocol.hpp"
#include "test_support.hpp"

using namespace qrcast;

namespace {

HeaderFrame sample_header() {
    HeaderFrame h;
    h.session_id = 0xDEADBEEFCAFEF00Dull;
    h.filename = "report.pdf";
    h.total_size = 123456;
    h.original_size = 200000;
    h.created_at = 1760000000;
    h.chunk_size = 1024;
    h.total_chunks = 121;
    h.parity_group_size = 8;
    for (size_t i = 0; i < h.content_hash.size(); ++i)
        h.content_hash[i] = (uint8_t)i;
    h.compressed = true;
    return h;
}

DataFrame sample_data() {
    DataFrame d;
    d.session_id = 42;
    d.chunk_index = 7;
    d.total_chunks = 9;
    d.payload = test::pattern_bytes(300);
    d.checksum = crc32(d.payload.data(), d.payload.size());
    return d;
}

std::optional<Frame> decode(const std::vector<uint8_t>& wire) {
    return decode_frame(wire.data(), wire.size());
}

} // namespace

TEST(Crc32, KnownVector) {
    const char* s = "123456789";
    EXPECT_EQ(0xCBF43926u, crc32((const uint8_t*)s, std::strlen(s)));
}

TEST(FrameCodec, PrefixLayoutIsLittleEndian) {
    auto wire = encode_frame(Frame::make(sample_data()));
    ASSERT_GE(wire.size(), sizeof(FramePrefix));
    EXPECT_EQ(0x58, wire[0]);
    EXPECT_EQ(0x54, wire[1]);
    EXPECT_EQ(0x52, wire[2]);
    EXPECT_EQ(0x51, wire[3]);
    EXPECT_EQ(kVersion, wire[4]);
    EXPECT_EQ((uint8_t)FrameType::Data, wire[5]);
    EXPECT_EQ(42, wire[8]);
    EXPECT_EQ(kDataFrameOverhead + 300, wire.size());
}

TEST(FrameCodec, HeaderSurvivesDecode) {
    Frame f = Frame::make(sample_header());
    auto wire = encode_frame(f);
    EXPECT_EQ(header_frame_size(f.header.filename.size()), wire.size());
    auto back = decode(wire);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(f, *back);
    EXPECT_TRUE(back->header.compressed);
}

TEST(FrameCodec, DataAndParitySurviveDecode) {
    Frame d = Frame::make(sample_data());
    auto back = decode(encode_frame(d));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(d, *back);

    ParityFrame p;
    p.session_id = 42;
    p.group_id = 1;
    p.first_index = 8;
    p.member_count = 2;
    p.total_chunks = 10;
    p.payload = test::pattern_bytes(64, 3);
    Frame pf = Frame::make(p);
    auto pback = decode(encode_frame(pf));
    ASSERT_TRUE(pback.has_value());
    EXPECT_EQ(pf, *pback);
}

TEST(FrameCodec, LongFilenameIsTruncatedOnTheWire) {
    HeaderFrame h = sample_header();
    h.filename = std::string(400, 'x');
    auto back = decode(encode_frame(Frame::make(h)));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(kMaxFilename, back->header.filename.size());
}

TEST(FrameCodec, RejectsCorruption) {
    auto wire = encode_frame(Frame::make(sample_data()));
    for (size_t pos : {size_t(0), size_t(5), size_t(20), wire.size() / 2, wire.size() - 1}) {
        auto bad = wire;
        bad[pos] ^= 0x40;
        EXPECT_FALSE(decode(bad).has_value()) << "flip at " << pos;
    }
}

TEST(FrameCodec, RejectsTruncation) {
    auto wire = encode_frame(Frame::make(sample_header()));
    for (size_t n : {size_t(0), size_t(10), sizeof(FramePrefix), wire.size() - 1}) {
        std::vector<uint8_t> cut(wire.begin(), wire.begin() + n);
        EXPECT_FALSE(decode(cut).has_value()) << "length " << n;
    }
}

// A well formed CRC does not make a frame valid on its own.
TEST(FrameCodec, RejectsBadFieldsWithValidCrc) {
    auto reseal = [](std::vector<uint8_t> w) {
        w.resize(w.size() - kCrcSize);
        uint32_t c = crc32(w.data(), w.size());
        for (int i = 0; i < 4; ++i)
            w.push_back((uint8_t)(c >> (i * 8)));
        return w;
    };
    auto wire = encode_frame(Frame::make(sample_data()));

    auto bad_version = wire;
    bad_version[4] = kVersion + 1;
    EXPECT_FALSE(decode(reseal(bad_version)).has_value());

    auto bad_type = wire;
    bad_type[5] = 9;
    EXPECT_FALSE(decode(reseal(bad_type)).has_value());

    DataFrame d = sample_data();
    d.chunk_index = d.total_chunks;
    EXPECT_FALSE(decode(encode_frame(Frame::make(d))).has_value());
}
