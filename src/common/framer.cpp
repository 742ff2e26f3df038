
#include "framer.hpp"
#include "errors.hpp"
#include "protocol.hpp"
#include <algorithm>

namespace qrcast {

std::vector<Chunk> frame_payload(const std::vector<uint8_t> &payload,
                                 size_t chunk_size) {
  if (chunk_size == 0)
    throw TransferError(Errc::InvalidConfiguration, "chunk size must be > 0");
  if (chunk_size > 0xFFFF)
    throw TransferError(Errc::InvalidConfiguration,
                        "chunk size exceeds 65535 bytes");
  if (payload.empty())
    throw TransferError(Errc::EmptyFile, "file is empty");

  size_t total_chunks = (payload.size() + chunk_size - 1) / chunk_size;
  if (total_chunks > kMaxChunks)
    throw TransferError(Errc::OversizeFile,
                        "file needs " + std::to_string(total_chunks) +
                            " chunks, limit is " + std::to_string(kMaxChunks));

  std::vector<Chunk> chunks;
  chunks.reserve(total_chunks);
  for (size_t i = 0; i < total_chunks; ++i) {
    size_t offset = i * chunk_size;
    size_t len = std::min(chunk_size, payload.size() - offset);

    Chunk c;
    c.index = static_cast<uint16_t>(i);
    c.payload.assign(payload.begin() + offset, payload.begin() + offset + len);
    c.checksum = crc32(c.payload.data(), c.payload.size());
    chunks.push_back(std::move(c));
  }
  return chunks;
}

size_t max_chunk_payload(size_t symbol_capacity) {
  if (symbol_capacity <= kDataFrameOverhead)
    return 0;
  return std::min<size_t>(symbol_capacity - kDataFrameOverhead, 0xFFFF);
}

} // namespace qrcast
