
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace qrcast {

// zlib stream of data, or nullopt when compression fails or does not shrink it.
std::optional<std::vector<uint8_t>> deflate_payload(const std::vector<uint8_t>& data,
                                                    int level = 6);

std::optional<std::vector<uint8_t>> inflate_payload(const std::vector<uint8_t>& data,
                                                    size_t original_size);

} // namespace qrcast
