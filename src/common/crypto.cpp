
#include "crypto.hpp"
#include <sodium.h>
#include <stdexcept>

namespace qrcast {

static_assert(crypto_hash_sha256_BYTES == kHashSize,
              "content hash must hold a SHA-256 digest");

bool crypto_init() { return sodium_init() >= 0; }

uint64_t random_session_id() {
  if (!crypto_init())
    throw std::runtime_error("libsodium initialisation failed");
  uint64_t id = 0;
  while (id == 0)
    randombytes_buf(&id, sizeof(id));
  return id;
}

ContentHash content_hash(const std::vector<uint8_t> &data) {
  if (!crypto_init())
    throw std::runtime_error("libsodium initialisation failed");
  ContentHash h{};
  crypto_hash_sha256(h.data(), data.data(), data.size());
  return h;
}

} // namespace qrcast
