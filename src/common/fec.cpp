
#include "fec.hpp"
#include "framer.hpp"
#include <algorithm>

namespace qrcast {

std::vector<ParityGroup> GroupParity::partition(size_t total_chunks) const {
  std::vector<ParityGroup> groups;
  if (group_size_ == 0)
    return groups;
  groups.reserve((total_chunks + group_size_ - 1) / group_size_);
  for (size_t first = 0; first < total_chunks; first += group_size_) {
    ParityGroup g;
    g.group_id = (uint16_t)(first / group_size_);
    g.first_index = (uint16_t)first;
    g.member_count = (uint16_t)std::min<size_t>(group_size_, total_chunks - first);
    groups.push_back(g);
  }
  return groups;
}

std::vector<uint8_t> GroupParity::encode(const std::vector<Chunk> &chunks,
                                         const ParityGroup &group) const {
  size_t end = std::min<size_t>(group.first_index + group.member_count,
                                chunks.size());
  size_t width = 0;
  for (size_t i = group.first_index; i < end; i++)
    width = std::max(width, chunks[i].payload.size());

  std::vector<uint8_t> p(width, 0);
  for (size_t i = group.first_index; i < end; i++) {
    const auto &d = chunks[i].payload;
    for (size_t j = 0; j < d.size(); j++)
      p[j] ^= d[j];
  }
  return p;
}

std::optional<std::vector<uint8_t>> GroupParity::recover_one(
    const std::vector<std::vector<uint8_t>> &members,
    const std::vector<bool> &present_mask,
    const std::vector<uint8_t> &parity) const {
  if (parity.empty() || members.size() != present_mask.size())
    return std::nullopt;
  size_t missing_cnt = 0;
  for (size_t i = 0; i < present_mask.size(); ++i) {
    if (!present_mask[i])
      missing_cnt++;
  }
  if (missing_cnt != 1)
    return std::nullopt;
  std::vector<uint8_t> rec(parity);
  for (size_t i = 0; i < members.size(); ++i) {
    if (!present_mask[i])
      continue;
    if (members[i].size() > rec.size())
      return std::nullopt;
    for (size_t j = 0; j < members[i].size(); j++)
      rec[j] ^= members[i][j];
  }
  return rec;
}

} // namespace qrcast
