
#include "errors.hpp"

namespace qrcast {

const char *errc_str(Errc e) {
  switch (e) {
  case Errc::EmptyFile:
    return "EmptyFile";
  case Errc::OversizeFile:
    return "OversizeFile";
  case Errc::InvalidConfiguration:
    return "InvalidConfiguration";
  case Errc::PayloadTooLarge:
    return "PayloadTooLarge";
  case Errc::SessionNotIdle:
    return "SessionNotIdle";
  default:
    return "FileUnreadable";
  }
}

} // namespace qrcast
