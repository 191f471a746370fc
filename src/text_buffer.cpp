#include "text_buffer.hpp"
#include <algorithm>
#include <stdexcept>

TextBuffer::TextBuffer() { li_.build(gb_); }

size_t TextBuffer::size() const { return gb_.length(); }
bool TextBuffer::empty() const { return size() == 0; }
std::string TextBuffer::text() const { return gb_.text(); }

std::string TextBuffer::slice(size_t start, size_t end) const {
  if (start > end || end > size()) throw std::out_of_range("slice range outside buffer");
  return gb_.slice(start, end - start);
}

char TextBuffer::at(size_t offset) const {
  if (offset >= size()) throw std::out_of_range("offset outside buffer");
  return gb_.at(offset);
}

int TextBuffer::line_count() const { return static_cast<int>(li_.line_count()); }

size_t TextBuffer::line_start(int row) const {
  if (row <= 0) return 0;
  return li_.line_start(static_cast<size_t>(row));
}

size_t TextBuffer::line_length(int row) const {
  if (row < 0 || row >= line_count()) return 0;
  size_t start = line_start(row);
  size_t end = (row + 1 < line_count()) ? line_start(row + 1) - 1 : size();
  return end - start;
}

std::string TextBuffer::line(int row) const {
  if (row < 0 || row >= line_count()) return std::string();
  return gb_.slice(line_start(row), line_length(row));
}

void TextBuffer::insert(size_t offset, std::string_view text) {
  if (offset > size()) throw std::out_of_range("insert offset past end of buffer");
  if (text.empty()) return;
  if (observer_) observer_->on_insert(offset, text);
  gb_.insert_at(offset, text);
  li_.build(gb_);
  if (cursor_ >= offset) cursor_ += text.size();
}

void TextBuffer::erase(size_t start, size_t end) {
  if (start > end || end > size()) throw std::out_of_range("erase range outside buffer");
  if (start == end) return;
  if (observer_) {
    std::string deleted = gb_.slice(start, end - start);
    observer_->on_delete(start, end, deleted, cursor_);
  }
  gb_.erase_range(start, end - start);
  li_.build(gb_);
  if (cursor_ >= end) cursor_ -= (end - start);
  else if (cursor_ > start) cursor_ = start;
}

// reported as erase-all then insert; the storage is rebuilt in one pass
void TextBuffer::set_text(std::string_view text) {
  if (observer_) {
    if (!empty()) observer_->on_delete(0, size(), gb_.text(), cursor_);
    if (!text.empty()) observer_->on_insert(0, text);
  }
  gb_.init_from_text(text);
  li_.build(gb_);
  cursor_ = text.size();
}

void TextBuffer::place_cursor(size_t offset) {
  if (offset > size()) throw std::out_of_range("cursor offset past end of buffer");
  cursor_ = offset;
}

Cursor TextBuffer::cursor_position() const {
  size_t row = li_.row_of(cursor_);
  Cursor c;
  c.row = static_cast<int>(row);
  c.col = static_cast<int>(cursor_ - li_.line_start(row));
  return c;
}

size_t TextBuffer::offset_at(int row, int col) const {
  row = std::clamp(row, 0, std::max(0, line_count() - 1));
  size_t len = line_length(row);
  size_t c = static_cast<size_t>(std::max(0, col));
  return line_start(row) + std::min(c, len);
}
