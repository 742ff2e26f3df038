
#pragma once
#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "protocol.hpp"

namespace qrcast {

enum class EccLevel : uint8_t { L = 0, M, Q, H };

// Square module grid, row major, 1 = dark.
struct Matrix {
    int width{0};
    std::vector<uint8_t> modules;

    bool dark(int x, int y) const { return modules[(size_t)y * width + x] != 0; }
};

// Byte-mode capacity of a version 40 QR symbol.
size_t qr_byte_capacity(EccLevel ecc);

class SymbolRenderer {
public:
    virtual ~SymbolRenderer() = default;
    virtual size_t capacity(EccLevel ecc) const = 0;
    // Throws TransferError(PayloadTooLarge) if bytes do not fit one symbol.
    virtual Matrix render(const std::vector<uint8_t>& bytes, EccLevel ecc) const = 0;
};

#ifdef QRCAST_HAVE_QRENCODE
class QrencodeRenderer : public SymbolRenderer {
public:
    size_t capacity(EccLevel ecc) const override;
    Matrix render(const std::vector<uint8_t>& bytes, EccLevel ecc) const override;
};
#endif

struct RenderedFrame {
    FrameType type;
    uint16_t index;     // chunk index, group id, or 0 for headers
    size_t wire_size;
    std::shared_ptr<const Matrix> matrix;  // shared between repeats
};

using RenderedSequence = std::vector<RenderedFrame>;

// Encode and render every frame up front so the display path never encodes.
// Repeats of one frame object share one matrix.
RenderedSequence render_sequence(const FrameSequence& seq,
                                 const SymbolRenderer& renderer,
                                 EccLevel ecc, size_t capacity);

} // namespace qrcast
