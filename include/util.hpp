
#pragma once
#include <string>
#include <cstdint>
#include <vector>
#include "logging.hpp"
#include "symbol.hpp"

namespace qrcast {

bool parse_uint(const std::string& s, uint64_t max, uint64_t& out);
bool parse_ecc_level(const std::string& s, EccLevel& out);
bool parse_log_level(const std::string& s, LogLevel& out);
const char* ecc_level_str(EccLevel ecc);

std::string bytes_to_hex(const uint8_t* data, size_t len);
std::string format_size(uint64_t bytes);

// Shorten s to at most max bytes without splitting a UTF-8 sequence.
void truncate_utf8(std::string& s, size_t max);

} // namespace qrcast
