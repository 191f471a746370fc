#include "line_index.hpp"
#include "gap_buffer.hpp"
#include <algorithm>

void LineIndex::build(const GapBuffer& gb) {
  blocks.clear();
  size_t len = gb.length();
  std::vector<size_t> starts;
  starts.push_back(0);
  for (size_t i = 0; i < len; ++i) {
    if (gb.at(i) == '\n') starts.push_back(i + 1);
  }
  size_t n = starts.size();
  for (size_t i = 0; i < n; i += block_size) {
    size_t end = std::min(n, i + block_size);
    LineBlock b;
    b.base_offset = starts[i];
    b.rel.reserve(end - i);
    for (size_t k = i; k < end; ++k) b.rel.push_back(starts[k] - b.base_offset);
    blocks.push_back(std::move(b));
  }
}

size_t LineIndex::line_count() const {
  size_t c = 0;
  for (const auto& b : blocks) c += b.rel.size();
  return c;
}

size_t LineIndex::line_start(size_t row) const {
  if (blocks.empty()) return 0;
  size_t acc = 0;
  for (const auto& b : blocks) {
    if (row < acc + b.rel.size()) return b.base_offset + b.rel[row - acc];
    acc += b.rel.size();
  }
  return blocks.back().base_offset + blocks.back().rel.back();
}

// row containing offset; an offset right after '\n' belongs to the next row
size_t LineIndex::row_of(size_t offset) const {
  if (blocks.empty()) return 0;
  size_t acc = 0;
  for (size_t i = 0; i < blocks.size(); ++i) {
    const LineBlock& b = blocks[i];
    bool last = (i + 1 == blocks.size());
    if (last || offset < blocks[i + 1].base_offset) {
      auto it = std::upper_bound(b.rel.begin(), b.rel.end(), offset - b.base_offset);
      return acc + static_cast<size_t>(it - b.rel.begin()) - 1;
    }
    acc += b.rel.size();
  }
  return acc - 1;
}
