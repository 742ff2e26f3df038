
#include "protocol.hpp"
#include <algorithm>
#include <cstring>

namespace qrcast {

uint32_t crc32(const uint8_t *data, size_t len) {
  static const std::array<uint32_t, 256> table = [] {
    std::array<uint32_t, 256> t{};
    for (uint32_t i = 0; i < 256; i++) {
      uint32_t c = i;
      for (int j = 0; j < 8; j++)
        c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
      t[i] = c;
    }
    return t;
  }();
  uint32_t c = ~0u;
  for (size_t i = 0; i < len; i++)
    c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return ~c;
}

namespace {

// All multi-byte fields are little endian.
class Writer {
public:
  explicit Writer(std::vector<uint8_t> &out) : out_(out) {}
  void u8(uint8_t v) { out_.push_back(v); }
  void u16(uint16_t v) { put(v, 2); }
  void u32(uint32_t v) { put(v, 4); }
  void u64(uint64_t v) { put(v, 8); }
  void bytes(const uint8_t *p, size_t n) { out_.insert(out_.end(), p, p + n); }

private:
  void put(uint64_t v, int n) {
    for (int i = 0; i < n; ++i)
      out_.push_back((uint8_t)((v >> (i * 8)) & 0xFF));
  }
  std::vector<uint8_t> &out_;
};

class Reader {
public:
  Reader(const uint8_t *p, size_t n) : p_(p), n_(n) {}
  bool u8(uint8_t &v) {
    uint64_t t;
    if (!get(t, 1))
      return false;
    v = (uint8_t)t;
    return true;
  }
  bool u16(uint16_t &v) {
    uint64_t t;
    if (!get(t, 2))
      return false;
    v = (uint16_t)t;
    return true;
  }
  bool u32(uint32_t &v) {
    uint64_t t;
    if (!get(t, 4))
      return false;
    v = (uint32_t)t;
    return true;
  }
  bool u64(uint64_t &v) { return get(v, 8); }
  bool bytes(uint8_t *dst, size_t n) {
    if (n_ - off_ < n)
      return false;
    std::memcpy(dst, p_ + off_, n);
    off_ += n;
    return true;
  }
  bool vec(std::vector<uint8_t> &dst, size_t n) {
    if (n_ - off_ < n)
      return false;
    dst.assign(p_ + off_, p_ + off_ + n);
    off_ += n;
    return true;
  }
  size_t remaining() const { return n_ - off_; }

private:
  bool get(uint64_t &v, int n) {
    if (n_ - off_ < (size_t)n)
      return false;
    v = 0;
    for (int i = 0; i < n; ++i)
      v |= (uint64_t)p_[off_ + i] << (i * 8);
    off_ += n;
    return true;
  }
  const uint8_t *p_;
  size_t n_;
  size_t off_{0};
};

void write_prefix(Writer &w, FrameType type, uint8_t flags, uint64_t sid) {
  w.u32(kMagic);
  w.u8(kVersion);
  w.u8((uint8_t)type);
  w.u8(flags);
  w.u8(0);
  w.u64(sid);
}

} // namespace

Frame Frame::make(HeaderFrame h) {
  Frame f;
  f.type = FrameType::Header;
  f.header = std::move(h);
  return f;
}

Frame Frame::make(DataFrame d) {
  Frame f;
  f.type = FrameType::Data;
  f.data = std::move(d);
  return f;
}

Frame Frame::make(ParityFrame p) {
  Frame f;
  f.type = FrameType::Parity;
  f.parity = std::move(p);
  return f;
}

uint64_t Frame::session_id() const {
  switch (type) {
  case FrameType::Header:
    return header.session_id;
  case FrameType::Data:
    return data.session_id;
  default:
    return parity.session_id;
  }
}

bool operator==(const Frame &a, const Frame &b) {
  if (a.type != b.type)
    return false;
  switch (a.type) {
  case FrameType::Header: {
    const auto &x = a.header, &y = b.header;
    return x.session_id == y.session_id && x.filename == y.filename &&
           x.total_size == y.total_size &&
           x.original_size == y.original_size && x.created_at == y.created_at &&
           x.chunk_size == y.chunk_size && x.total_chunks == y.total_chunks &&
           x.parity_group_size == y.parity_group_size &&
           x.content_hash == y.content_hash && x.compressed == y.compressed;
  }
  case FrameType::Data: {
    const auto &x = a.data, &y = b.data;
    return x.session_id == y.session_id && x.chunk_index == y.chunk_index &&
           x.total_chunks == y.total_chunks && x.checksum == y.checksum &&
           x.payload == y.payload;
  }
  default: {
    const auto &x = a.parity, &y = b.parity;
    return x.session_id == y.session_id && x.group_id == y.group_id &&
           x.first_index == y.first_index &&
           x.member_count == y.member_count &&
           x.total_chunks == y.total_chunks && x.payload == y.payload;
  }
  }
}

size_t header_frame_size(size_t filename_len) {
  return sizeof(FramePrefix) + kHeaderBodyFixed + filename_len + kCrcSize;
}

std::vector<uint8_t> encode_frame(const Frame &f) {
  std::vector<uint8_t> out;
  Writer w(out);
  switch (f.type) {
  case FrameType::Header: {
    const HeaderFrame &h = f.header;
    size_t name_len = std::min(h.filename.size(), kMaxFilename);
    out.reserve(header_frame_size(name_len));
    write_prefix(w, FrameType::Header, h.compressed ? FF_COMPRESSED : 0,
                 h.session_id);
    w.u64(h.total_size);
    w.u64(h.original_size);
    w.u64(h.created_at);
    w.u16(h.chunk_size);
    w.u16(h.total_chunks);
    w.u16(h.parity_group_size);
    w.bytes(h.content_hash.data(), h.content_hash.size());
    w.u8((uint8_t)name_len);
    w.bytes((const uint8_t *)h.filename.data(), name_len);
    break;
  }
  case FrameType::Data: {
    const DataFrame &d = f.data;
    out.reserve(kDataFrameOverhead + d.payload.size());
    write_prefix(w, FrameType::Data, 0, d.session_id);
    w.u16(d.chunk_index);
    w.u16(d.total_chunks);
    w.u32(d.checksum);
    w.u16((uint16_t)d.payload.size());
    w.bytes(d.payload.data(), d.payload.size());
    break;
  }
  case FrameType::Parity: {
    const ParityFrame &p = f.parity;
    out.reserve(kParityFrameOverhead + p.payload.size());
    write_prefix(w, FrameType::Parity, 0, p.session_id);
    w.u16(p.group_id);
    w.u16(p.first_index);
    w.u16(p.member_count);
    w.u16(p.total_chunks);
    w.u16((uint16_t)p.payload.size());
    w.bytes(p.payload.data(), p.payload.size());
    break;
  }
  }
  w.u32(crc32(out.data(), out.size()));
  return out;
}

std::optional<Frame> decode_frame(const uint8_t *data, size_t len) {
  if (len < sizeof(FramePrefix) + kCrcSize)
    return std::nullopt;
  size_t body_end = len - kCrcSize;
  Reader crc_r(data + body_end, kCrcSize);
  uint32_t want = 0;
  crc_r.u32(want);
  if (crc32(data, body_end) != want)
    return std::nullopt;

  Reader r(data, body_end);
  uint32_t magic = 0;
  uint8_t version = 0, type = 0, flags = 0, reserved = 0;
  uint64_t sid = 0;
  r.u32(magic);
  r.u8(version);
  r.u8(type);
  r.u8(flags);
  r.u8(reserved);
  r.u64(sid);
  if (magic != kMagic || version != kVersion)
    return std::nullopt;

  switch ((FrameType)type) {
  case FrameType::Header: {
    HeaderFrame h;
    h.session_id = sid;
    h.compressed = (flags & FF_COMPRESSED) != 0;
    uint8_t name_len = 0;
    if (!r.u64(h.total_size) || !r.u64(h.original_size) ||
        !r.u64(h.created_at) || !r.u16(h.chunk_size) ||
        !r.u16(h.total_chunks) || !r.u16(h.parity_group_size) ||
        !r.bytes(h.content_hash.data(), h.content_hash.size()) ||
        !r.u8(name_len) || r.remaining() != name_len)
      return std::nullopt;
    h.filename.resize(name_len);
    r.bytes((uint8_t *)&h.filename[0], name_len);
    return Frame::make(std::move(h));
  }
  case FrameType::Data: {
    DataFrame d;
    d.session_id = sid;
    uint16_t n = 0;
    if (!r.u16(d.chunk_index) || !r.u16(d.total_chunks) ||
        !r.u32(d.checksum) || !r.u16(n) || r.remaining() != n ||
        !r.vec(d.payload, n))
      return std::nullopt;
    if (d.chunk_index >= d.total_chunks)
      return std::nullopt;
    return Frame::make(std::move(d));
  }
  case FrameType::Parity: {
    ParityFrame p;
    p.session_id = sid;
    uint16_t n = 0;
    if (!r.u16(p.group_id) || !r.u16(p.first_index) ||
        !r.u16(p.member_count) || !r.u16(p.total_chunks) || !r.u16(n) ||
        r.remaining() != n || !r.vec(p.payload, n))
      return std::nullopt;
    if (p.member_count == 0 ||
        (uint32_t)p.first_index + p.member_count > p.total_chunks)
      return std::nullopt;
    return Frame::make(std::move(p));
  }
  }
  return std::nullopt;
}

const char *frame_type_str(FrameType t) {
  switch (t) {
  case FrameType::Header:
    return "header";
  case FrameType::Data:
    return "data";
  default:
    return "parity";
  }
}

} // namespace qrcast
