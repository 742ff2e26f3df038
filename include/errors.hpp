
#pragma once
#include <stdexcept>
#include <string>

namespace qrcast {

enum class Errc {
    EmptyFile,
    OversizeFile,
    InvalidConfiguration,
    PayloadTooLarge,
    SessionNotIdle,
    FileUnreadable
};

const char* errc_str(Errc e);

// Raised while loading or building a transfer, before any frame is shown.
class TransferError : public std::runtime_error {
public:
    TransferError(Errc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    Errc code() const noexcept { return code_; }
private:
    Errc code_;
};

} // namespace qrcast
