#pragma once
/*
 * TextBuffer
 *
 * Purpose: offset-addressed text with a cursor and line lookup.
 * Storage: GapBuffer + LineIndex; every insert/erase is announced to the
 * observer first, so it can still read the text being removed.
 * Errors: offsets outside the buffer throw std::out_of_range, nothing mutates.
 */
#include <string>
#include <string_view>
#include "gap_buffer.hpp"
#include "line_index.hpp"
#include "i_buffer_observer.hpp"
#include "types.hpp"

class TextBuffer {
public:
  TextBuffer();

  size_t size() const;
  bool empty() const;
  std::string text() const;
  std::string slice(size_t start, size_t end) const;
  char at(size_t offset) const;

  int line_count() const;
  std::string line(int row) const;
  size_t line_start(int row) const;
  size_t line_length(int row) const;

  void insert(size_t offset, std::string_view text);
  void erase(size_t start, size_t end);
  void set_text(std::string_view text);

  size_t cursor() const { return cursor_; }
  void place_cursor(size_t offset);
  Cursor cursor_position() const;
  size_t offset_at(int row, int col) const;

  void set_observer(IBufferObserver* obs) { observer_ = obs; }
  IBufferObserver* observer() const { return observer_; }

private:
  GapBuffer gb_;
  LineIndex li_;
  size_t cursor_ = 0;
  IBufferObserver* observer_ = nullptr;
};
