
#include "symbol.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <map>
#include <utility>

#ifdef QRCAST_HAVE_QRENCODE
#include <cerrno>
#include <qrencode.h>
#endif

namespace qrcast {

size_t qr_byte_capacity(EccLevel ecc) {
  switch (ecc) {
  case EccLevel::L:
    return 2953;
  case EccLevel::M:
    return 2331;
  case EccLevel::Q:
    return 1663;
  default:
    return 1273;
  }
}

#ifdef QRCAST_HAVE_QRENCODE
static QRecLevel to_qr_level(EccLevel ecc) {
  switch (ecc) {
  case EccLevel::L:
    return QR_ECLEVEL_L;
  case EccLevel::M:
    return QR_ECLEVEL_M;
  case EccLevel::Q:
    return QR_ECLEVEL_Q;
  default:
    return QR_ECLEVEL_H;
  }
}

size_t QrencodeRenderer::capacity(EccLevel ecc) const {
  return qr_byte_capacity(ecc);
}

Matrix QrencodeRenderer::render(const std::vector<uint8_t> &bytes,
                                EccLevel ecc) const {
  if (bytes.size() > capacity(ecc))
    throw TransferError(Errc::PayloadTooLarge,
                        "frame of " + std::to_string(bytes.size()) +
                            " bytes exceeds symbol capacity");
  // version 0 lets the library pick the smallest symbol that fits
  QRcode *qr = QRcode_encodeData((int)bytes.size(), bytes.data(), 0,
                                 to_qr_level(ecc));
  if (!qr) {
    if (errno == ERANGE)
      throw TransferError(Errc::PayloadTooLarge,
                          "frame rejected by QR encoder as too large");
    throw std::runtime_error("QRcode_encodeData failed");
  }
  Matrix m;
  m.width = qr->width;
  m.modules.resize((size_t)qr->width * qr->width);
  for (size_t i = 0; i < m.modules.size(); ++i)
    m.modules[i] = qr->data[i] & 1;
  QRcode_free(qr);
  return m;
}
#endif

RenderedSequence render_sequence(const FrameSequence &seq,
                                 const SymbolRenderer &renderer, EccLevel ecc,
                                 size_t capacity) {
  RenderedSequence out;
  out.reserve(seq.size());
  // keyed by frame object: repeats are the same pointer, wire bytes are
  // dropped once rendered
  std::map<const Frame *, std::pair<size_t, std::shared_ptr<const Matrix>>>
      cache;
  for (const auto &fp : seq) {
    const Frame &f = *fp;
    RenderedFrame r;
    r.type = f.type;
    r.index = f.type == FrameType::Data     ? f.data.chunk_index
              : f.type == FrameType::Parity ? f.parity.group_id
                                            : 0;
    auto it = cache.find(fp.get());
    if (it == cache.end()) {
      std::vector<uint8_t> wire = encode_frame(f);
      if (wire.size() > capacity) {
        Logger::instance().log(LogLevel::ERROR,
                               "%s frame is %zu bytes, symbol capacity %zu",
                               frame_type_str(f.type), wire.size(), capacity);
        throw TransferError(Errc::PayloadTooLarge,
                            std::string(frame_type_str(f.type)) +
                                " frame exceeds symbol capacity");
      }
      auto m = std::make_shared<const Matrix>(renderer.render(wire, ecc));
      it = cache.emplace(fp.get(), std::make_pair(wire.size(), std::move(m)))
               .first;
    }
    r.wire_size = it->second.first;
    r.matrix = it->second.second;
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace qrcast
