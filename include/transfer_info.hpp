
#pragma once
#include <cstdint>
#include <string>
#include "protocol.hpp"

namespace qrcast {

// Metadata of one transfer. Fixed once the session starts transmitting.
struct TransferInfo {
    uint64_t session_id{0};
    std::string filename;
    uint64_t total_size{0};
    uint64_t original_size{0};
    bool compressed{false};
    ContentHash content_hash{};
    uint16_t chunk_size{0};
    uint16_t total_chunks{0};
    uint64_t created_at{0};
};

} // namespace qrcast
