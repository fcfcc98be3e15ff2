#include "hole_list.hpp"
#include <algorithm>

namespace pacsat {

HoleList::HoleList(uint32_t size) {
  if (size > 0)
    holes_.push_back(ByteRange{0, size});
}

uint32_t HoleList::fill(uint32_t start, uint32_t end) {
  if (start >= end)
    return 0;
  uint32_t filled = 0;
  std::vector<ByteRange> next;
  next.reserve(holes_.size() + 1);
  for (const auto &h : holes_) {
    if (h.end <= start || h.start >= end) {
      next.push_back(h);
      continue;
    }
    uint32_t lo = std::max(h.start, start);
    uint32_t hi = std::min(h.end, end);
    filled += hi - lo;
    if (h.start < lo)
      next.push_back(ByteRange{h.start, lo});
    if (hi < h.end)
      next.push_back(ByteRange{hi, h.end});
  }
  holes_.swap(next);
  return filled;
}

void HoleList::add(uint32_t start, uint32_t end) {
  if (start >= end)
    return;
  auto it = std::lower_bound(
      holes_.begin(), holes_.end(), start,
      [](const ByteRange &r, uint32_t v) { return r.end < v; });
  // it is the first hole that touches or follows start
  ByteRange merged{start, end};
  auto first = it;
  while (it != holes_.end() && it->start <= end) {
    merged.start = std::min(merged.start, it->start);
    merged.end = std::max(merged.end, it->end);
    ++it;
  }
  it = holes_.erase(first, it);
  holes_.insert(it, merged);
}

uint32_t HoleList::missing_bytes() const {
  uint32_t n = 0;
  for (const auto &h : holes_)
    n += h.length();
  return n;
}

bool HoleList::missing(uint32_t offset) const {
  for (const auto &h : holes_) {
    if (offset < h.start)
      return false;
    if (offset < h.end)
      return true;
  }
  return false;
}

uint32_t HoleList::contiguous_prefix(uint32_t size) const {
  if (holes_.empty())
    return size;
  return holes_.front().start;
}

bool HoleList::well_formed() const {
  for (size_t i = 0; i < holes_.size(); i++) {
    if (holes_[i].start >= holes_[i].end)
      return false;
    if (i > 0 && holes_[i - 1].end >= holes_[i].start)
      return false;
  }
  return true;
}

} // namespace pacsat
