
#pragma once
#include <cstdint>
#include <vector>
#include "protocol.hpp"

namespace qrcast {

// Initialise libsodium; safe to call more than once.
bool crypto_init();

// Random token distinguishing this transfer from earlier or later ones.
uint64_t random_session_id();

// SHA-256 over the whole file, checked end to end by the receiver.
ContentHash content_hash(const std::vector<uint8_t>& data);

} // namespace qrcast
