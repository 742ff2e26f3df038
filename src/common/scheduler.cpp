
#include "scheduler.hpp"
#include "errors.hpp"
#include "util.hpp"

namespace qrcast {

HeaderFrame make_header_frame(const TransferInfo &info,
                              const RedundancyPlan &plan) {
  HeaderFrame h;
  h.session_id = info.session_id;
  h.filename = info.filename;
  truncate_utf8(h.filename, kMaxFilename);
  h.total_size = info.total_size;
  h.original_size = info.original_size;
  h.created_at = info.created_at;
  h.chunk_size = info.chunk_size;
  h.total_chunks = info.total_chunks;
  h.parity_group_size = plan.parity ? plan.parity_group_size : 0;
  h.content_hash = info.content_hash;
  h.compressed = info.compressed;
  return h;
}

FrameSequence build_sequence(const TransferInfo &info,
                             const std::vector<Chunk> &chunks,
                             const RedundancyPlan &plan) {
  if (info.chunk_size == 0)
    throw TransferError(Errc::InvalidConfiguration, "chunk size must be > 0");
  if (plan.repetition == 0)
    throw TransferError(Errc::InvalidConfiguration,
                        "repetition factor must be > 0");
  if (plan.parity_group_size == 0)
    throw TransferError(Errc::InvalidConfiguration,
                        "parity group size must be > 0");
  if (chunks.empty() || chunks.size() != info.total_chunks)
    throw TransferError(Errc::InvalidConfiguration,
                        "chunk list does not match transfer metadata");

  GroupParity fec(plan.parity_group_size);
  std::vector<ParityGroup> groups = fec.partition(chunks.size());

  std::vector<FramePtr> parity_frames;
  if (plan.parity) {
    parity_frames.reserve(groups.size());
    for (const auto &g : groups) {
      ParityFrame p;
      p.session_id = info.session_id;
      p.group_id = g.group_id;
      p.first_index = g.first_index;
      p.member_count = g.member_count;
      p.total_chunks = info.total_chunks;
      p.payload = fec.encode(chunks, g);
      parity_frames.push_back(
          std::make_shared<const Frame>(Frame::make(std::move(p))));
    }
  }

  FramePtr header =
      std::make_shared<const Frame>(Frame::make(make_header_frame(info, plan)));

  std::vector<FramePtr> data_frames;
  data_frames.reserve(chunks.size());
  for (const auto &c : chunks) {
    DataFrame d;
    d.session_id = info.session_id;
    d.chunk_index = c.index;
    d.total_chunks = info.total_chunks;
    d.checksum = c.checksum;
    d.payload = c.payload;
    data_frames.push_back(
        std::make_shared<const Frame>(Frame::make(std::move(d))));
  }

  size_t per_pass = 1 + data_frames.size() + parity_frames.size();
  FrameSequence seq;
  seq.reserve(per_pass * plan.repetition);
  for (uint16_t pass = 0; pass < plan.repetition; ++pass) {
    seq.push_back(header);
    for (const auto &g : groups) {
      for (uint16_t i = 0; i < g.member_count; ++i)
        seq.push_back(data_frames[g.first_index + i]);
      if (plan.parity)
        seq.push_back(parity_frames[g.group_id]);
    }
  }
  return seq;
}

SequenceStats sequence_stats(const FrameSequence &seq) {
  SequenceStats s;
  for (const auto &f : seq) {
    switch (f->type) {
    case FrameType::Header:
      s.header_frames++;
      break;
    case FrameType::Data:
      s.data_frames++;
      break;
    case FrameType::Parity:
      s.parity_frames++;
      break;
    }
  }
  return s;
}

} // namespace qrcast
