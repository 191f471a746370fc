#pragma once
/*
 * GapBuffer
 *
 * Purpose: contiguous byte storage with a movable gap at the edit point.
 * Note: positions are logical (gap excluded); callers validate ranges.
 */
#include <vector>
#include <string>
#include <string_view>

class GapBuffer {
public:
  std::vector<char> buf;
  size_t gap_start = 0;
  size_t gap_end = 0;

  size_t length() const;
  char at(size_t pos) const;
  void init_from_text(std::string_view text);
  void move_gap_to(size_t pos);
  void ensure_gap(size_t need);
  void insert_at(size_t pos, std::string_view text);
  void erase_range(size_t pos, size_t len);
  std::string slice(size_t pos, size_t len) const;
  std::string text() const;
};
