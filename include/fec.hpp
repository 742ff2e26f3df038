
#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>
#include <optional>

namespace qrcast {

struct Chunk;

struct RedundancyPlan {
    uint16_t repetition{3};
    uint16_t parity_group_size{8};
    bool parity{true};
};

struct ParityGroup {
    uint16_t group_id;
    uint16_t first_index;
    uint16_t member_count;
};

class GroupParity {
public:
    explicit GroupParity(uint16_t group_size) : group_size_(group_size) {}

    // Consecutive runs of group_size indices; the last run may be short.
    std::vector<ParityGroup> partition(size_t total_chunks) const;

    // Byte-wise XOR of the members, zero-extended to the longest one.
    std::vector<uint8_t> encode(const std::vector<Chunk>& chunks,
                                const ParityGroup& group) const;

    // Rebuild the single missing member of a group. present_mask[i] tells
    // whether members[i] was observed; exactly one must be false. The result
    // has parity length; the caller trims it to the member's real size.
    std::optional<std::vector<uint8_t>> recover_one(
        const std::vector<std::vector<uint8_t>>& members,
        const std::vector<bool>& present_mask,
        const std::vector<uint8_t>& parity) const;

    uint16_t group_size() const { return group_size_; }
private:
    uint16_t group_size_;
};

} // namespace qrcast
