#pragma once
/*
 * LineIndex
 *
 * Purpose: map rows to byte offsets (and back) over a GapBuffer.
 * Layout: line starts grouped in fixed-size blocks of relative offsets.
 */
#include <vector>
#include <cstddef>

class GapBuffer;

struct LineBlock {
  size_t base_offset;
  std::vector<size_t> rel;
};

class LineIndex {
public:
  std::vector<LineBlock> blocks;
  size_t block_size = 1024;

  void build(const GapBuffer& gb);
  size_t line_count() const;
  size_t line_start(size_t row) const;
  size_t row_of(size_t offset) const;
};
