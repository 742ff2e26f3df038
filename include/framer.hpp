
#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

namespace qrcast {

struct Chunk {
    uint16_t index;
    uint32_t checksum;
    std::vector<uint8_t> payload;
};

// Slice payload into ceil(size / chunk_size) chunks; the last one keeps its
// real length. Throws TransferError on empty input, zero chunk size, or more
// chunks than the wire index can address.
std::vector<Chunk> frame_payload(const std::vector<uint8_t>& payload,
                                 size_t chunk_size);

// Largest chunk whose data frame still fits a symbol of symbol_capacity bytes.
size_t max_chunk_payload(size_t symbol_capacity);

} // namespace qrcast
