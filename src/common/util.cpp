
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace qrcast {

bool parse_uint(const std::string &s, uint64_t max, uint64_t &out) {
  if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
      }))
    return false;
  try {
    unsigned long long v = std::stoull(s);
    if (v > max)
      return false;
    out = v;
    return true;
  } catch (const std::out_of_range &) {
    return false;
  }
}

bool parse_ecc_level(const std::string &s, EccLevel &out) {
  if (s.size() != 1)
    return false;
  switch (std::toupper((unsigned char)s[0])) {
  case 'L':
    out = EccLevel::L;
    return true;
  case 'M':
    out = EccLevel::M;
    return true;
  case 'Q':
    out = EccLevel::Q;
    return true;
  case 'H':
    out = EccLevel::H;
    return true;
  default:
    return false;
  }
}

bool parse_log_level(const std::string &s, LogLevel &out) {
  std::string l(s);
  std::transform(l.begin(), l.end(), l.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  if (l == "trace")
    out = LogLevel::TRACE;
  else if (l == "debug")
    out = LogLevel::DEBUG;
  else if (l == "info")
    out = LogLevel::INFO;
  else if (l == "warn")
    out = LogLevel::WARN;
  else if (l == "error")
    out = LogLevel::ERROR;
  else
    return false;
  return true;
}

const char *ecc_level_str(EccLevel ecc) {
  switch (ecc) {
  case EccLevel::L:
    return "L";
  case EccLevel::M:
    return "M";
  case EccLevel::Q:
    return "Q";
  default:
    return "H";
  }
}

std::string bytes_to_hex(const uint8_t *data, size_t len) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

std::string format_size(uint64_t bytes) {
  static const char *units[] = {"B", "KB", "MB", "GB"};
  double v = (double)bytes;
  for (const char *u : units) {
    if (v < 1024.0) {
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%.1f %s", v, u);
      return buf;
    }
    v /= 1024.0;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f TB", v);
  return buf;
}

void truncate_utf8(std::string &s, size_t max) {
  if (s.size() <= max)
    return;
  size_t n = max;
  // back up over continuation bytes (10xxxxxx) to a lead byte
  while (n > 0 && ((unsigned char)s[n] & 0xC0) == 0x80)
    --n;
  s.resize(n);
}

} // namespace qrcast
