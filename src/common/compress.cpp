
#include "compress.hpp"
#include "logging.hpp"
#include <zlib.h>

namespace qrcast {

std::optional<std::vector<uint8_t>>
deflate_payload(const std::vector<uint8_t> &data, int level) {
  if (data.empty())
    return std::nullopt;
  uLongf dst_len = compressBound((uLong)data.size());
  std::vector<uint8_t> out(dst_len);
  int rc = compress2(out.data(), &dst_len, data.data(), (uLong)data.size(),
                     level);
  if (rc != Z_OK) {
    Logger::instance().log(LogLevel::WARN, "compress2 failed: %d", rc);
    return std::nullopt;
  }
  if (dst_len >= data.size())
    return std::nullopt;
  out.resize(dst_len);
  return out;
}

std::optional<std::vector<uint8_t>>
inflate_payload(const std::vector<uint8_t> &data, size_t original_size) {
  std::vector<uint8_t> out(original_size);
  uLongf dst_len = (uLongf)original_size;
  int rc = uncompress(out.data(), &dst_len, data.data(), (uLong)data.size());
  if (rc != Z_OK || dst_len != original_size)
    return std::nullopt;
  return out;
}

} // namespace qrcast
