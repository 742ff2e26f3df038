
#pragma once
#include <cstddef>
#include <vector>
#include "fec.hpp"
#include "framer.hpp"
#include "protocol.hpp"
#include "transfer_info.hpp"

namespace qrcast {

// One cycle is plan.repetition passes; each pass is a header frame followed
// by every data frame in index order, with a group's parity frame right after
// the group's last data frame. The result depends only on the arguments.
FrameSequence build_sequence(const TransferInfo& info,
                             const std::vector<Chunk>& chunks,
                             const RedundancyPlan& plan);

HeaderFrame make_header_frame(const TransferInfo& info, const RedundancyPlan& plan);

struct SequenceStats {
    size_t header_frames{0};
    size_t data_frames{0};
    size_t parity_frames{0};
};

SequenceStats sequence_stats(const FrameSequence& seq);

} // namespace qrcast
