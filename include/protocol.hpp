
#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qrcast {

constexpr uint32_t kMagic = 0x51525458; // 'QRTX'
constexpr uint8_t  kVersion = 1;

// Chunk indices travel as uint16_t on the wire.
constexpr uint32_t kMaxChunks = 0xFFFF;
constexpr size_t   kMaxFilename = 255;
constexpr size_t   kHashSize = 32;

enum class FrameType : uint8_t { Header = 1, Data = 2, Parity = 3 };

enum FrameFlags : uint8_t {
    FF_COMPRESSED = 0x01
};

#pragma pack(push, 1)
struct FramePrefix {
    uint32_t magic;
    uint8_t  version;
    uint8_t  type;
    uint8_t  flags;
    uint8_t  reserved;
    uint64_t session_id;
};
#pragma pack(pop)
static_assert(sizeof(FramePrefix) == 16, "FramePrefix must be 16 bytes");

constexpr size_t kCrcSize = 4;
constexpr size_t kHeaderBodyFixed = 8 + 8 + 8 + 2 + 2 + 2 + kHashSize + 1;
constexpr size_t kDataBodyFixed = 2 + 2 + 4 + 2;
constexpr size_t kParityBodyFixed = 2 + 2 + 2 + 2 + 2;

// Wire bytes a data frame needs around its chunk payload.
constexpr size_t kDataFrameOverhead = sizeof(FramePrefix) + kDataBodyFixed + kCrcSize;
constexpr size_t kParityFrameOverhead = sizeof(FramePrefix) + kParityBodyFixed + kCrcSize;

using ContentHash = std::array<uint8_t, kHashSize>;

struct HeaderFrame {
    uint64_t session_id{0};
    std::string filename;
    uint64_t total_size{0};
    uint64_t original_size{0};
    uint64_t created_at{0};
    uint16_t chunk_size{0};
    uint16_t total_chunks{0};
    uint16_t parity_group_size{0};
    ContentHash content_hash{};
    bool compressed{false};
};

struct DataFrame {
    uint64_t session_id{0};
    uint16_t chunk_index{0};
    uint16_t total_chunks{0};
    uint32_t checksum{0};
    std::vector<uint8_t> payload;
};

struct ParityFrame {
    uint64_t session_id{0};
    uint16_t group_id{0};
    uint16_t first_index{0};
    uint16_t member_count{0};
    uint16_t total_chunks{0};
    std::vector<uint8_t> payload;
};

struct Frame {
    FrameType type{FrameType::Data};
    HeaderFrame header;
    DataFrame data;
    ParityFrame parity;

    static Frame make(HeaderFrame h);
    static Frame make(DataFrame d);
    static Frame make(ParityFrame p);
    uint64_t session_id() const;
};

bool operator==(const Frame& a, const Frame& b);
inline bool operator!=(const Frame& a, const Frame& b) { return !(a == b); }

// Repetition passes hold the same frame objects, so a sequence costs one
// copy of the payload however many passes it has.
using FramePtr = std::shared_ptr<const Frame>;
using FrameSequence = std::vector<FramePtr>;

uint32_t crc32(const uint8_t* data, size_t len);

std::vector<uint8_t> encode_frame(const Frame& f);
std::optional<Frame> decode_frame(const uint8_t* data, size_t len);

size_t header_frame_size(size_t filename_len);

const char* frame_type_str(FrameType t);

} // namespace qrcast
