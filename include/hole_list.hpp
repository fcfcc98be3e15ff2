#pragma once
#include <cstdint>
#include <vector>
#include "protocol.hpp"

namespace pacsat {

// Sorted set of missing byte ranges. Ranges never overlap or touch; any
// operation that would leave two adjacent ranges merges them.
class HoleList {
public:
    HoleList() = default;
    explicit HoleList(uint32_t size);

    // Marks [start, end) as received. Returns how many of those bytes were
    // still missing; 0 means the write was a pure duplicate.
    uint32_t fill(uint32_t start, uint32_t end);
    // Marks [start, end) as missing again.
    void add(uint32_t start, uint32_t end);
    void clear() { holes_.clear(); }

    bool empty() const { return holes_.empty(); }
    const std::vector<ByteRange>& ranges() const { return holes_; }
    uint32_t missing_bytes() const;
    bool missing(uint32_t offset) const;
    // Bytes received contiguously from offset 0, given the transfer size.
    uint32_t contiguous_prefix(uint32_t size) const;
    bool well_formed() const;

private:
    std::vector<ByteRange> holes_;
};

} // namespace pacsat
